#include "Application.h"
#include "Connectivity/ManualNetworkMonitor.h"
#include "Interfaces/IDownloadListener.h"
#include "Interfaces/INotificationListener.h"
#include "Lib/GeneralUtils.h"
#include "Lib/TaskScope.h"
#include <atomic>
#include <chrono>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

namespace {
    class ConsoleListener : public INotificationListener, public IDownloadListener {
    public:
        void onError(const std::string& message) override { std::cerr << "Error: " << message << std::endl; }
        void onInfo(const std::string& message) override { std::cout << message << std::endl; }

        void onImageDownloaded(const std::string& id, uint32_t pagesDownloaded) override {
            std::cout << id << ": " << pagesDownloaded << " pages downloaded" << std::endl;
        }

        void onDownloadRemoved(const std::string& id) override { std::cout << id << " removed" << std::endl; }
        void onDownloadCanceled(const std::string& id) override { std::cout << id << " cancelled" << std::endl; }
    };

    void printUsage() {
        std::cerr << "Usage: lrr_client <command> [arguments]" << std::endl
                  << "  info" << std::endl
                  << "  search <filter>" << std::endl
                  << "  random <count>" << std::endl
                  << "  categories" << std::endl
                  << "  extract <id> [--force]" << std::endl
                  << "  download <id>" << std::endl
                  << "  clear-temp" << std::endl;
    }

    void printArchives(const std::vector<sArchive>& archives) {
        for (const auto& archive : archives) {
            std::cout << archive.id << "  " << archive.title << (archive.isNew ? "  [new]" : "") << std::endl;
        }
    }

    auto runCommand(Application& application, const std::vector<std::string>& args, std::stop_token token) -> int {
        const auto& client = application.getServerClient();
        const auto& command = args[0];

        if (command == "info") {
            auto info = client->getServerInfo(token);
            if (!info) {
                return 1;
            }

            std::cout << info->dump(4) << std::endl;
            return 0;
        }

        if (command == "search" && args.size() >= 2) {
            auto result = client->searchServer(args[1], false, eSortMethod::Alpha, false, 0, {}, token);
            if (!result) {
                return 1;
            }

            printArchives(result->archives);
            std::cout << result->totalFiltered << " of " << result->total << " archives match" << std::endl;
            return 0;
        }

        if (command == "random" && args.size() >= 2) {
            auto archives = client->getRandomArchives("", static_cast<uint32_t>(std::stoul(args[1])), {}, token);
            if (!archives) {
                return 1;
            }

            printArchives(*archives);
            return 0;
        }

        if (command == "categories") {
            if (!application.getCategoryManager()->refresh(token)) {
                return 1;
            }

            for (const auto& category : application.getCategoryManager()->getCategories()) {
                std::cout << category.id << "  " << category.name << (category.isStatic() ? "" : "  (" + category.search + ")") << std::endl;
            }

            return 0;
        }

        if (command == "extract" && args.size() >= 2) {
            auto force = args.size() >= 3 && args[2] == "--force";
            auto result = client->extractArchive(args[1], force, token);
            if (!result) {
                return 1;
            }

            std::cout << client->parsePageList(*result).size() << " pages" << std::endl;
            return 0;
        }

        if (command == "download" && args.size() >= 2) {
            const auto& id = args[1];
            const auto& downloads = application.getDownloadManager();

            if (downloads->isDownloaded(id)) {
                downloads->resumeDownload(id, downloads->getDownloadedPageCount(id));
            } else {
                downloads->download(id);
            }

            InterruptableTimer timer;
            while (downloads->isDownloading(id)) {
                if (!timer.wait_for(std::chrono::milliseconds(100), token)) {
                    downloads->cancelDownload(id);
                    return 1;
                }
            }

            std::cout << downloads->getDownloadedPageCount(id) << " pages stored for " << id << std::endl;
            return 0;
        }

        if (command == "clear-temp") {
            return client->clearTempFolder(token) ? 0 : 1;
        }

        printUsage();
        return 1;
    }
}

auto main(int argc, char* argv[]) -> int
{
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        auto listener = std::make_shared<ConsoleListener>();
        Application application(sApplicationConfig::fromEnvironment(), std::make_shared<ManualNetworkMonitor>());
        application.getNotifier()->setListener(listener);
        application.getDownloadManager()->addListener(listener);
        application.initialize();

        auto uiContext = application.getUiContext();
        auto uiGuard = boost::asio::make_work_guard(*uiContext);
        std::atomic<bool> bDone = false;
        int result = 1;

        {
            TaskScope scope;

            boost::asio::signal_set signals(*uiContext, SIGINT, SIGTERM);
            signals.async_wait([&scope](const boost::system::error_code& error, int) {
                if (!error) {
                    std::cout << "APP: Interrupted" << std::endl;
                    scope.cancel();
                }
            });

            scope.launch([&](std::stop_token token) {
                try {
                    result = runCommand(application, args, token);
                } catch (std::exception& exception) {
                    dumpExceptions(exception);
                }
                bDone = true;
            });

            // Listener notifications are delivered on this thread
            while (!bDone) {
                uiContext->run_for(std::chrono::milliseconds(100));
            }

            signals.cancel();
        }

        uiContext->poll();
        application.shutdown();
        return result;
    } catch (std::exception& exception) {
        dumpExceptions(exception);
        return 1;
    }
}
