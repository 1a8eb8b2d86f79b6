#include <gtest/gtest.h>
#include <phm/heartbeat_channel.hpp>
#include <warden/phm/heartbeat_client.hpp>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <vector>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

// Collects what listener threads post
struct Inbox {
    std::mutex mu;
    std::condition_variable cv;
    std::vector<phm::HeartbeatObserved> beats;

    phm::HeartbeatSink sink() {
        return [this](phm::HeartbeatObserved hb) {
            std::scoped_lock lk(mu);
            beats.push_back(std::move(hb));
            cv.notify_all();
        };
    }

    bool wait_for(std::size_t n, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock lk(mu);
        return cv.wait_for(lk, timeout, [&] { return beats.size() >= n; });
    }
};

class HeartbeatChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("warden_hb_" + std::to_string(::getpid()));
        fs::remove_all(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

template <typename Pred>
bool eventually(Pred p, std::chrono::milliseconds timeout = 2000ms) {
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (p()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return p();
}

} // namespace

TEST_F(HeartbeatChannelTest, EndpointNamedAfterBaseAndSession) {
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    EXPECT_EQ(factory.endpoint_for(4), (dir_ / "hb_4").string());
}

TEST_F(HeartbeatChannelTest, WorkerBeatsReachTheSink) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    auto ch = factory.create(3, 2, std::nullopt, inbox.sink());
    ASSERT_TRUE(ch.HasValue()) << ch.Error().Message();
    EXPECT_TRUE(fs::exists(dir_ / "hb_3"));
    EXPECT_EQ(fs::status(dir_ / "hb_3").permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write);

    warden::phm::HeartbeatClient client(dir_.string(), "hb", 3);
    ASSERT_TRUE(client.Connect());
    ASSERT_TRUE(client.ReportAlive("idle"));
    ASSERT_TRUE(client.ReportAlive());

    ASSERT_TRUE(inbox.wait_for(2));
    std::scoped_lock lk(inbox.mu);
    EXPECT_EQ(inbox.beats[0].session_id, 3);
    EXPECT_EQ(inbox.beats[0].generation, 2u);
    EXPECT_EQ(inbox.beats[0].seq, 1u);
    EXPECT_EQ(inbox.beats[0].status, "idle");
    EXPECT_EQ(inbox.beats[1].seq, 2u);
}

TEST_F(HeartbeatChannelTest, StopCommandReachesWorker) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    auto ch = factory.create(5, 1, std::nullopt, inbox.sink());
    ASSERT_TRUE(ch.HasValue());

    warden::phm::HeartbeatClient client(dir_.string(), "hb", 5);
    ASSERT_TRUE(client.ReportAlive());   // connects on demand
    ASSERT_TRUE(inbox.wait_for(1));      // listener has accepted by now
    EXPECT_FALSE(client.StopRequested());

    ASSERT_TRUE(ch.Value()->send_stop());
    EXPECT_TRUE(eventually([&] { return client.StopRequested(); }));
}

TEST_F(HeartbeatChannelTest, SendStopWithoutWorkerFails) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    auto ch = factory.create(6, 1, std::nullopt, inbox.sink());
    ASSERT_TRUE(ch.HasValue());
    auto r = ch.Value()->send_stop();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.Error().value, warden::core::SupervisorErrc::kChannelFailed);
}

TEST_F(HeartbeatChannelTest, CloseRemovesEndpointAndIsIdempotent) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    auto ch = factory.create(7, 1, std::nullopt, inbox.sink());
    ASSERT_TRUE(ch.HasValue());
    ch.Value()->close();
    EXPECT_FALSE(fs::exists(dir_ / "hb_7"));
    ch.Value()->close();

    warden::phm::HeartbeatClient client(dir_.string(), "hb", 7);
    EXPECT_FALSE(client.Connect());
}

TEST_F(HeartbeatChannelTest, NewGenerationReplacesOldEndpoint) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    {
        auto old = factory.create(8, 1, std::nullopt, inbox.sink());
        ASSERT_TRUE(old.HasValue());
    }
    auto ch = factory.create(8, 2, std::nullopt, inbox.sink());
    ASSERT_TRUE(ch.HasValue());

    warden::phm::HeartbeatClient client(dir_.string(), "hb", 8);
    ASSERT_TRUE(client.ReportAlive());
    ASSERT_TRUE(inbox.wait_for(1));
    std::scoped_lock lk(inbox.mu);
    EXPECT_EQ(inbox.beats[0].generation, 2u);
}

TEST_F(HeartbeatChannelTest, MalformedFramesAreIgnored) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    auto ch = factory.create(9, 1, std::nullopt, inbox.sink());
    ASSERT_TRUE(ch.HasValue());

    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const std::string path = (dir_ / "hb_9").string();
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

    const std::string wire = "garbage\n{\"ts_ms\":1}\n{\"seq\":41}\n";
    ASSERT_EQ(::write(fd, wire.data(), wire.size()), static_cast<ssize_t>(wire.size()));

    ASSERT_TRUE(inbox.wait_for(1));
    std::this_thread::sleep_for(50ms);
    ::close(fd);
    std::scoped_lock lk(inbox.mu);
    ASSERT_EQ(inbox.beats.size(), 1u);
    EXPECT_EQ(inbox.beats[0].seq, 41u);
}

TEST_F(HeartbeatChannelTest, ClientReconnectsAfterChannelRecreated) {
    Inbox inbox;
    phm::UnixHeartbeatChannelFactory factory(dir_.string(), "hb");
    auto first = factory.create(10, 1, std::nullopt, inbox.sink());
    ASSERT_TRUE(first.HasValue());

    warden::phm::HeartbeatClient client(dir_.string(), "hb", 10);
    ASSERT_TRUE(client.ReportAlive());
    ASSERT_TRUE(inbox.wait_for(1));

    first.Value()->close();
    auto second = factory.create(10, 2, std::nullopt, inbox.sink());
    ASSERT_TRUE(second.HasValue());

    // the first send after the peer closed may still succeed locally
    EXPECT_TRUE(eventually([&] {
        (void)client.ReportAlive();
        std::scoped_lock lk(inbox.mu);
        return !inbox.beats.empty() && inbox.beats.back().generation == 2u;
    }));
}
