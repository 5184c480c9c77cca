//
// Bounded download scheduling, resume, cancellation and listener delivery
//

#include <boost/test/unit_test.hpp>

#include <regex>

#include "../../tests/fixtures/ApplicationFixture.h"
#include "../DownloadLayout.h"

struct DownloadTestFixture : public ApplicationFixture
{
    std::shared_ptr<DownloadManager> manager = application->getDownloadManager();
    std::shared_ptr<DownloadRecorder> recorder = std::make_shared<DownloadRecorder>();
    std::filesystem::path downloads = manager->getDownloadsDirectory();

    // Extraction and page requests wait for these before replying
    std::atomic<bool> bRelease = true;
    std::atomic<bool> bReleasePages = true;

    DownloadTestFixture()
    {
        route("GET", "/api/archives/[^/]+/page", [this](const Response& response, const Request& request) {
            waitFor([this]() { return bReleasePages.load(); }, std::chrono::seconds(10));
            response->write(SimpleWeb::StatusCode::success_ok, "page-" + request->query_string);
        });

        route("GET", "/api/archives/[^/]+/thumbnail", [](const Response& response, const Request& request) {
            response->write(SimpleWeb::StatusCode::success_ok, "thumb-" + request->query_string);
        });
    }

    ~DownloadTestFixture()
    {
        bRelease = true;
        bReleasePages = true;
    }

    DownloadTestFixture(DownloadTestFixture const&)                    = delete;
    auto operator=(DownloadTestFixture const&) -> DownloadTestFixture& = delete;
    DownloadTestFixture(DownloadTestFixture&&)                         = delete;
    auto operator=(DownloadTestFixture&&) -> DownloadTestFixture&      = delete;

    // Every archive has pageCount pages served at /api/archives/<id>/page?path=<index>
    void routeExtract(uint32_t pageCount)
    {
        route("POST", "/api/archives/[^/]+/extract", [this, pageCount](const Response& response, const Request& request) {
            waitFor([this]() { return bRelease.load(); }, std::chrono::seconds(10));

            std::smatch match;
            static const std::regex idRegex("/api/archives/([^/]+)/extract");
            std::regex_match(request->path, match, idRegex);

            nlohmann::json reply = {{"job", 0}, {"pages", nlohmann::json::array()}};
            for (uint32_t index = 0; index < pageCount; index++) {
                reply["pages"].push_back("./api/archives/" + match[1].str() + "/page?path=" + std::to_string(index));
            }
            response->write(SimpleWeb::StatusCode::success_ok, reply.dump());
        });
    }

    auto waitForDownload(const std::string& id) const -> bool
    {
        return waitFor([&]() { return !manager->isDownloading(id); });
    }
};

BOOST_FIXTURE_TEST_SUITE(download_manager_test_suite, DownloadTestFixture)

BOOST_AUTO_TEST_CASE(test_download_writes_pages_and_thumbnails)
{
    routeExtract(3);
    manager->addListener(recorder);

    manager->download("a1");
    BOOST_REQUIRE(waitForDownload("a1"));

    BOOST_CHECK_EQUAL(manager->isDownloaded("a1"), true);
    BOOST_CHECK_EQUAL(manager->getDownloadedPageCount("a1"), 3);
    for (uint32_t page = 0; page < 3; page++) {
        BOOST_REQUIRE(manager->getDownloadedPage("a1", page).has_value());
        BOOST_REQUIRE(manager->getDownloadedThumb("a1", page).has_value());
        BOOST_CHECK_EQUAL(readFile(pagePath(downloads, "a1", page)), "page-path=" + std::to_string(page));
        BOOST_CHECK_EQUAL(readFile(thumbPath(downloads, "a1", page)), "thumb-page=" + std::to_string(page + 1) + "&no_fallback=true");
    }

    // Progress only reaches listeners through the UI context
    BOOST_CHECK(recorder->progress().empty());
    drainUiContext();

    auto progress = recorder->progress();
    BOOST_REQUIRE_EQUAL(progress.size(), 4);
    for (uint32_t index = 0; index < 4; index++) {
        BOOST_CHECK_EQUAL(progress[index].first, "a1");
        BOOST_CHECK_EQUAL(progress[index].second, index);
    }

    BOOST_CHECK_EQUAL(manager->getpermits()->available(), 3);
}

BOOST_AUTO_TEST_CASE(test_at_most_three_downloads_run)
{
    bRelease = false;
    routeExtract(1);

    for (const auto* id : {"a1", "a2", "a3", "a4"}) {
        manager->download(id);
    }

    BOOST_REQUIRE(waitFor([this]() { return requestCount("POST", ".*/extract") == 3; }));

    // The fourth download is registered but waits for a permit
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    BOOST_CHECK_EQUAL(requestCount("POST", ".*/extract"), 3);
    BOOST_CHECK_EQUAL(manager->getpermits()->available(), 0);
    for (const auto* id : {"a1", "a2", "a3", "a4"}) {
        BOOST_CHECK_EQUAL(manager->isDownloading(id), true);
    }

    bRelease = true;
    for (const auto* id : {"a1", "a2", "a3", "a4"}) {
        BOOST_REQUIRE(waitForDownload(id));
        BOOST_CHECK_EQUAL(manager->getDownloadedPageCount(id), 1);
    }

    BOOST_CHECK_EQUAL(requestCount("POST", ".*/extract"), 4);
    BOOST_CHECK_EQUAL(manager->getpermits()->available(), 3);
}

BOOST_AUTO_TEST_CASE(test_cancel_waiting_download_releases_nothing)
{
    bRelease = false;
    routeExtract(1);
    manager->addListener(recorder);

    for (const auto* id : {"a1", "a2", "a3", "a4"}) {
        manager->download(id);
    }

    BOOST_REQUIRE(waitFor([this]() { return requestCount("POST", ".*/extract") == 3; }));

    manager->cancelDownload("a4");
    BOOST_CHECK_EQUAL(manager->isDownloading("a4"), false);

    bRelease = true;
    for (const auto* id : {"a1", "a2", "a3"}) {
        BOOST_REQUIRE(waitForDownload(id));
    }

    BOOST_REQUIRE(waitFor([this]() { return manager->getpermits()->available() == 3; }));

    // The cancelled archive never reached the server
    BOOST_CHECK_EQUAL(requestCount("POST", "/api/archives/a4/extract"), 0);

    drainUiContext();
    auto canceled = recorder->canceled();
    BOOST_REQUIRE_EQUAL(canceled.size(), 1);
    BOOST_CHECK_EQUAL(canceled[0], "a4");
}

BOOST_AUTO_TEST_CASE(test_cancel_then_download_again)
{
    bRelease = false;
    routeExtract(2);

    manager->download("a1");
    BOOST_REQUIRE(waitFor([this]() { return requestCount("POST", ".*/extract") == 1; }));

    manager->cancelDownload("a1");
    BOOST_CHECK_EQUAL(manager->isDownloading("a1"), false);

    // The partial copy is kept, so starting again needs an overwrite
    manager->download("a1");
    BOOST_CHECK_EQUAL(manager->isDownloading("a1"), false);

    // A new download of the same archive replaces the cancelled one
    bRelease = true;
    manager->download("a1", true);
    BOOST_REQUIRE(waitForDownload("a1"));

    BOOST_CHECK_EQUAL(manager->getDownloadedPageCount("a1"), 2);
    BOOST_REQUIRE(waitFor([this]() { return manager->getpermits()->available() == 3; }));
    BOOST_CHECK(manager->getmRunningDownloads()->empty());
}

BOOST_AUTO_TEST_CASE(test_download_of_downloaded_archive_is_ignored)
{
    routeExtract(2);

    manager->download("a1");
    BOOST_REQUIRE(waitForDownload("a1"));
    BOOST_CHECK_EQUAL(manager->getDownloadedPageCount("a1"), 2);

    auto requestsBefore = requestCount();

    manager->download("a1");
    BOOST_CHECK_EQUAL(manager->isDownloading("a1"), false);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    BOOST_CHECK_EQUAL(requestCount(), requestsBefore);
    BOOST_CHECK_EQUAL(requestCount("POST", ".*/extract"), 1);
    BOOST_CHECK_EQUAL(requestCount("GET", ".*/page"), 2);
}

BOOST_AUTO_TEST_CASE(test_restarted_download_tracks_its_own_progress)
{
    bReleasePages = false;
    routeExtract(1);

    manager->download("a1");
    BOOST_REQUIRE(waitFor([this]() { return requestCount("GET", ".*/page") == 1; }));

    manager->cancelDownload("a1");

    // The replacement stays at its first page while the cancelled worker finishes its page
    bRelease = false;
    manager->download("a1", true);
    BOOST_REQUIRE(waitFor([this]() { return requestCount("POST", ".*/extract") == 2; }));

    bReleasePages = true;
    BOOST_REQUIRE(waitFor([this]() { return manager->getpermits()->available() == 2; }));

    auto iter = manager->getmRunningDownloads()->find("a1");
    BOOST_REQUIRE(iter != manager->getmRunningDownloads()->cend());
    BOOST_CHECK_EQUAL(iter->second->pageCount(), 0);

    bRelease = true;
    BOOST_REQUIRE(waitForDownload("a1"));
    BOOST_CHECK_EQUAL(manager->getDownloadedPageCount("a1"), 1);
}

BOOST_AUTO_TEST_CASE(test_duplicate_download_is_ignored)
{
    bRelease = false;
    routeExtract(1);

    manager->download("a1");
    manager->download("a1");
    manager->resumeDownload("a1", 0);

    BOOST_REQUIRE(waitFor([this]() { return requestCount("POST", ".*/extract") == 1; }));
    bRelease = true;
    BOOST_REQUIRE(waitForDownload("a1"));

    BOOST_CHECK_EQUAL(requestCount("POST", ".*/extract"), 1);
}

BOOST_AUTO_TEST_CASE(test_resume_only_fetches_remaining_pages)
{
    routeExtract(4);

    // Nothing to resume yet
    manager->resumeDownload("a1", 2);
    BOOST_CHECK_EQUAL(manager->isDownloading("a1"), false);
    BOOST_CHECK_EQUAL(requestCount(), 0);

    std::filesystem::create_directories(archiveDirectory(downloads, "a1"));
    writeFile(pagePath(downloads, "a1", 0), "old-0");
    writeFile(pagePath(downloads, "a1", 1), "old-1");

    manager->addListener(recorder);
    manager->resumeDownload("a1", 2);
    BOOST_REQUIRE(waitForDownload("a1"));

    BOOST_CHECK_EQUAL(readFile(pagePath(downloads, "a1", 0)), "old-0");
    BOOST_CHECK_EQUAL(readFile(pagePath(downloads, "a1", 1)), "old-1");
    BOOST_CHECK_EQUAL(readFile(pagePath(downloads, "a1", 2)), "page-path=2");
    BOOST_CHECK_EQUAL(readFile(pagePath(downloads, "a1", 3)), "page-path=3");
    BOOST_CHECK_EQUAL(requestCount("GET", "/api/archives/a1/page"), 2);

    drainUiContext();
    auto progress = recorder->progress();
    BOOST_REQUIRE_EQUAL(progress.size(), 3);
    BOOST_CHECK_EQUAL(progress[0].second, 2);
    BOOST_CHECK_EQUAL(progress[2].second, 4);
}

BOOST_AUTO_TEST_CASE(test_overwrite_discards_previous_files)
{
    routeExtract(1);

    std::filesystem::create_directories(archiveDirectory(downloads, "a1"));
    writeFile(pagePath(downloads, "a1", 5), "stale");

    manager->download("a1", true);
    BOOST_REQUIRE(waitForDownload("a1"));

    BOOST_CHECK(!manager->getDownloadedPage("a1", 5).has_value());
    BOOST_CHECK_EQUAL(manager->getDownloadedPageCount("a1"), 1);
}

BOOST_AUTO_TEST_CASE(test_new_listener_receives_running_progress)
{
    bRelease = false;
    routeExtract(1);

    manager->download("a1");
    BOOST_REQUIRE(waitFor([this]() { return requestCount("POST", ".*/extract") == 1; }));

    // The replay happens before addListener returns, not on the UI context
    manager->addListener(recorder);
    auto progress = recorder->progress();
    BOOST_REQUIRE_EQUAL(progress.size(), 1);
    BOOST_CHECK_EQUAL(progress[0].first, "a1");
    BOOST_CHECK_EQUAL(progress[0].second, 0);

    manager->removeListener(recorder);
    bRelease = true;
    BOOST_REQUIRE(waitForDownload("a1"));

    drainUiContext();
    BOOST_CHECK_EQUAL(recorder->progress().size(), 1);
}

BOOST_AUTO_TEST_CASE(test_progress_only_listener_skips_removals)
{
    auto progressOnly = std::make_shared<ImageDownloadRecorder>();
    manager->addListener(progressOnly);
    manager->addListener(recorder);

    std::filesystem::create_directories(archiveDirectory(downloads, "a1"));
    manager->deleteArchive("a1");
    BOOST_CHECK_EQUAL(manager->isDownloaded("a1"), false);

    drainUiContext();
    BOOST_REQUIRE_EQUAL(recorder->removed().size(), 1);
    BOOST_CHECK_EQUAL(recorder->removed()[0], "a1");
    BOOST_CHECK(progressOnly->vProgress.empty());
}

BOOST_AUTO_TEST_CASE(test_failed_extraction_downloads_nothing)
{
    routeStatus("POST", "/api/archives/a1/extract", SimpleWeb::StatusCode::server_error_internal_server_error);

    manager->download("a1");
    BOOST_REQUIRE(waitForDownload("a1"));

    BOOST_CHECK_EQUAL(manager->getDownloadedPageCount("a1"), 0);
    BOOST_CHECK_EQUAL(requestCount("GET", ".*/page"), 0);
    BOOST_CHECK_EQUAL(manager->getpermits()->available(), 3);
}

BOOST_AUTO_TEST_CASE(test_downloaded_archives_oldest_first)
{
    for (const auto* id : {"b", "a", "c"}) {
        std::filesystem::create_directories(archiveDirectory(downloads, id));
    }

    auto now = std::filesystem::file_time_type::clock::now();
    std::filesystem::last_write_time(archiveDirectory(downloads, "b"), now - std::chrono::hours(3));
    std::filesystem::last_write_time(archiveDirectory(downloads, "a"), now - std::chrono::hours(2));
    std::filesystem::last_write_time(archiveDirectory(downloads, "c"), now - std::chrono::hours(1));

    auto archives = manager->getDownloadedArchives();
    BOOST_REQUIRE_EQUAL(archives.size(), 3);
    BOOST_CHECK_EQUAL(archives[0], "b");
    BOOST_CHECK_EQUAL(archives[1], "a");
    BOOST_CHECK_EQUAL(archives[2], "c");
}

BOOST_AUTO_TEST_SUITE_END()
