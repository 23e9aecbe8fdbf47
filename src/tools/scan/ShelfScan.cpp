/*
 * Copyright (C) 2026 The ShelfScan authors
 *
 * This file is part of ShelfScan.
 *
 * ShelfScan is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * ShelfScan is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with ShelfScan.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <condition_variable>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <stdlib.h>
#include <thread>
#include <variant>

#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "services/scan/Exception.hpp"
#include "services/scan/IScanService.hpp"

namespace shelfscan::scan
{
    template<class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    std::ostream& operator<<(std::ostream& os, const BookMetadata& book)
    {
        os << "'" << book.title << "'";
        if (!book.author.empty())
            os << " by " << book.author;
        if (book.isbn)
            os << " (ISBN " << *book.isbn << ")";
        if (book.confidence)
            os << ", confidence = " << std::fixed << std::setprecision(2) << *book.confidence;

        return os;
    }

    std::ostream& operator<<(std::ostream& os, const ScanResult& result)
    {
        os << "Capture " << result.localId.getAsString();
        if (result.jobId)
            os << " (job " << *result.jobId << ")";
        os << ": ";

        if (result.isSuccess())
        {
            os << result.getBooks().size() << " book(s)" << std::endl;
            for (const BookMetadata& book : result.getBooks())
                os << "\t" << book << std::endl;
        }
        else
        {
            const ScanFailure& failure{ result.getFailure() };
            os << "failed: " << failure.reason;
            if (failure.code)
                os << " [" << *failure.code << "]";
            os << (failure.retryable ? " (retryable)" : "") << std::endl;
        }

        return os;
    }

    class ConsoleObserver final : public IScanObserver
    {
    public:
        ConsoleObserver(bool verbose)
            : _verbose{ verbose } {}

        void expect(const core::UUID& localId)
        {
            std::scoped_lock lock{ _mutex };
            if (!_settled.erase(localId))
                _pending.insert(localId);
        }

        // Waits for all the expected captures to be either terminal or deferred
        void waitAll()
        {
            std::unique_lock lock{ _mutex };
            _cv.wait(lock, [this] { return _pending.empty(); });
        }

    private:
        void onTerminalResult(const ScanResult& result) override
        {
            {
                std::scoped_lock lock{ _mutex };
                std::cout << result;
                settle(result.localId);
            }
            _cv.notify_all();
        }

        void onIntermediateEvent(const core::UUID& localId, const StreamEvent& event) override
        {
            if (!_verbose)
                return;

            std::scoped_lock lock{ _mutex };
            std::visit(overloaded{
                           [&](const event::Progress& progress) { std::cout << localId.getAsString() << ": " << progress.message << std::endl; },
                           [&](const event::BookProgress& progress) { std::cout << localId.getAsString() << ": book " << progress.currentIndex << "/" << progress.totalCount << std::endl; },
                           [&](const event::SegmentedPreview& preview) { std::cout << localId.getAsString() << ": " << preview.totalDetected << " spine(s) detected" << std::endl; },
                           [&](const event::EnrichmentDegraded& degraded) { std::cout << localId.getAsString() << ": enrichment degraded" << (degraded.reason ? " (" + *degraded.reason + ")" : "") << std::endl; },
                           [&](const auto&) {},
                       },
                event);
        }

        void onDeferred(const core::UUID& localId, DeferReason reason) override
        {
            {
                std::scoped_lock lock{ _mutex };
                std::cout << "Capture " << localId.getAsString() << ": deferred (" << getDeferReasonName(reason) << ")" << std::endl;
                settle(localId);
            }
            _cv.notify_all();
        }

        void settle(const core::UUID& localId)
        {
            if (!_pending.erase(localId))
                _settled.insert(localId);
        }

        const bool _verbose;
        std::mutex _mutex;
        std::condition_variable _cv;
        std::set<core::UUID> _pending;
        std::set<core::UUID> _settled; // results that came before expect()
    };

    ImageData readImage(const std::filesystem::path& p)
    {
        std::ifstream file{ p, std::ios::binary };
        if (!file)
            throw Exception{ "Cannot open image file '" + p.string() + "'" };

        ImageData res;
        char buffer[4096];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0)
        {
            for (std::streamsize i{}; i < file.gcount(); ++i)
                res.push_back(std::byte{ static_cast<unsigned char>(buffer[i]) });
        }

        if (res.empty())
            throw Exception{ "Image file '" + p.string() + "' is empty" };

        return res;
    }

    // Idle for two consecutive polls, to let the queue drains that are in progress start their jobs
    void waitForIdle(IScanService& scanService)
    {
        using namespace std::chrono_literals;

        std::size_t idlePollCount{};
        while (idlePollCount < 2)
        {
            const ScanStatus status{ scanService.getStatus() };
            if (status.activeCount == 0 && status.waitingCount == 0)
                idlePollCount++;
            else
                idlePollCount = 0;

            std::this_thread::sleep_for(100ms);
        }
    }

    void printStatus(IScanService& scanService)
    {
        const ScanStatus status{ scanService.getStatus() };

        std::cout << "Queued captures: " << status.queuedCount << std::endl;
        if (status.cooldownActive)
            std::cout << "Rate limited for " << status.cooldownRemaining.count() << "s, " << status.backlogCount << " capture(s) waiting" << std::endl;
    }
} // namespace shelfscan::scan

int main(int argc, char* argv[])
{
    try
    {
        using namespace shelfscan;
        namespace po = boost::program_options;

        po::options_description desc{ "Allowed options" };
        desc.add_options()("help,h", "print usage message")("conf,c", po::value<std::string>()->default_value("/etc/shelfscan.conf"), "ShelfScan config file")("drain,d", "Submit the captures stored in the offline queue")("offline", "Store the captures in the offline queue, do not submit them")("verbose,v", "Display intermediate events")("debug", "Enable debug logs")("image", po::value<std::vector<std::string>>()->composing(), "Photo of book spines, jpeg");

        po::positional_options_description positional;
        positional.add("image", -1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            std::cout << "Usage: " << argv[0] << " [options] [image...]" << std::endl;
            std::cout << desc << std::endl;
            return EXIT_SUCCESS;
        }

        const std::vector<std::string> images{ vm.count("image") ? vm["image"].as<std::vector<std::string>>() : std::vector<std::string>{} };
        if (images.empty() && !vm.count("drain"))
        {
            std::cerr << "Nothing to do, see --help" << std::endl;
            return EXIT_FAILURE;
        }

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        std::optional<core::logging::Severity> minSeverity{ core::logging::severityFromString(config->getString("log-min-severity", "info")) };
        if (!minSeverity)
            throw core::ShelfScanException{ "Invalid value for 'log-min-severity'" };
        if (vm.count("debug"))
            minSeverity = core::logging::Severity::DEBUG;
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(*minSeverity, config->getPath("log-file", "")) };

        std::vector<scan::ImageData> imageData;
        for (const std::string& image : images)
            imageData.push_back(scan::readImage(image));

        scan::ConsoleObserver observer{ vm.count("verbose") > 0 };

        boost::asio::io_context ioContext;
        core::IOContextRunner ioContextRunner{ ioContext, config->getULong("scan-io-threads", 2), "Scan" };

        // the service drains the offline queue at startup, if online
        std::unique_ptr<scan::IScanService> scanService{ scan::createScanService(ioContext, observer, !vm.count("offline")) };

        for (scan::ImageData& data : imageData)
            observer.expect(scanService->handleCapture(std::move(data)));

        observer.waitAll();
        scan::waitForIdle(*scanService);
        scan::printStatus(*scanService);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
