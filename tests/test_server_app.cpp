#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include <httplib.h>

#include "command_router.hpp"
#include "coordinator.hpp"
#include "fakes.hpp"
#include "server_app.hpp"

using namespace spex;
using namespace spex::fakes;

namespace {
class ServerAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.monitoring = false;
        auto dir = std::filesystem::temp_directory_path() / "spex_tests";
        std::filesystem::create_directories(dir);
        log_path = (dir / "server_announcements.jsonl").string();
        std::filesystem::remove(log_path);
        log = std::make_unique<AnnouncementLog>(log_path);
        coord = std::make_unique<Coordinator>(cfg, clock, Collaborators{source, voice, faces, hands, objects, text},
                                              gallery, log.get());
        server = std::make_unique<ServerApp>(*coord, *log, "127.0.0.1", 0);
        ASSERT_TRUE(server->start());
        ASSERT_GT(server->port(), 0);
    }

    void TearDown() override {
        server->stop();
        server.reset();
        coord.reset();
    }

    AppConfig cfg;
    ManualClock clock{0.0};
    IdentityGallery gallery;
    FakeSource source;
    FakeVoice voice;
    FakeFaces faces;
    ScriptedHands hands;
    FakeObjects objects;
    FakeText text;
    std::string log_path;
    std::unique_ptr<AnnouncementLog> log;
    std::unique_ptr<Coordinator> coord;
    std::unique_ptr<ServerApp> server;
};
}  // namespace

TEST_F(ServerAppTest, ReportsStatus) {
    clock.set(4.0);
    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Get("/status");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, status_to_json(coord->status()));
    EXPECT_NE(res->body.find("\"running\":true"), std::string::npos);
    EXPECT_NE(res->body.find("\"gallery_size\":0"), std::string::npos);
}

TEST_F(ServerAppTest, QueuesCommandsForTheForegroundLoop) {
    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Post("/command", "  help \n", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_EQ(res->body, "{\"queued\":true}");

    EXPECT_TRUE(coord->poll_once());
    EXPECT_EQ(voice.spoken().back(), kHelpText);
    EXPECT_EQ(voice.listens(), 0);
}

TEST_F(ServerAppTest, RejectsEmptyCommands) {
    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Post("/command", "   ", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(ServerAppTest, ServesAnnouncementLog) {
    httplib::Client cli("127.0.0.1", server->port());
    auto empty = cli.Get("/announcements");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->body, "[]");

    coord->dispatch("help");
    coord->dispatch("exit");
    auto res = cli.Get("/announcements");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body.front(), '[');
    EXPECT_EQ(res->body.back(), ']');
    EXPECT_NE(res->body.find("Goodbye! Stay safe!"), std::string::npos);
    EXPECT_NE(res->body.find("},{"), std::string::npos);
}

TEST_F(ServerAppTest, ReloadsTheGallery) {
    gallery.add(KnownIdentity{"Asha", "sister", {1.0f, 0.0f, 0.0f}});
    ASSERT_EQ(coord->status().gallery_size, 1u);

    httplib::Client cli("127.0.0.1", server->port());
    auto res = cli.Post("/gallery/reload", "", "text/plain");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "{\"loaded\":0}");
    EXPECT_EQ(coord->status().gallery_size, 0u);
}
