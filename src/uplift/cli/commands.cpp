// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/cli/commands.hpp>
#include <uplift/cli/progress_bar.hpp>
#include <uplift/core/error.hpp>
#include <uplift/core/mock_transport.hpp>
#include <uplift/core/queue_coordinator.hpp>
#include <uplift/disk/file_payload.hpp>
#include <uplift/log.hpp>
#include <uplift/net/http_transport.hpp>
#include <uplift/version.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <charconv>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>

namespace uplift::cli {

namespace {

constexpr std::chrono::milliseconds DRY_RUN_LATENCY{20};

std::optional<std::uint32_t> parse_count(std::string_view text) noexcept {
    std::uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

// Per-task progress folded into one aggregate line
struct Aggregate {
    std::map<core::TaskId, std::string> names;
    std::map<core::TaskId, std::uint64_t> uploaded;
    std::map<core::TaskId, std::uint64_t> speed;
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t cancelled{0};

    [[nodiscard]] std::uint64_t total_uploaded() const noexcept {
        std::uint64_t sum = 0;
        for (const auto& [id, bytes] : uploaded) sum += bytes;
        return sum;
    }

    [[nodiscard]] std::uint64_t total_speed() const noexcept {
        std::uint64_t sum = 0;
        for (const auto& [id, bps] : speed) sum += bps;
        return sum;
    }

    [[nodiscard]] std::string name(core::TaskId id) const {
        auto it = names.find(id);
        return it == names.end() ? std::to_string(id) : it->second;
    }
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) args.error = std::move(message);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            fail("Missing value for " + arg);
            return std::nullopt;
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value()) args.config_file = *v;
        } else if (arg == "-a" || arg == "--api") {
            if (auto v = value()) args.api_url = *v;
        } else if (arg == "-s" || arg == "--session") {
            if (auto v = value()) args.session_id = *v;
        } else if (arg == "-t" || arg == "--token") {
            if (auto v = value()) args.token = *v;
        } else if (arg == "-f" || arg == "--max-files") {
            if (auto v = value()) {
                if (auto n = parse_count(*v)) args.max_files = *n;
                else fail("Invalid --max-files: " + *v);
            }
        } else if (arg == "-k" || arg == "--max-chunks") {
            if (auto v = value()) {
                if (auto n = parse_count(*v)) args.max_chunks = *n;
                else fail("Invalid --max-chunks: " + *v);
            }
        } else if (arg == "-p" || arg == "--priority-mode") {
            if (auto v = value()) {
                if (auto mode = core::parse_priority_mode(*v)) args.priority_mode = mode;
                else fail("Invalid --priority-mode: " + *v);
            }
        } else if (arg == "-n" || arg == "--network") {
            if (auto v = value()) {
                if (auto type = core::parse_effective_type(*v)) args.network = type;
                else fail("Invalid --network: " + *v);
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            fail("Unknown option: " + arg);
        } else {
            args.files.push_back(arg);
        }
    }

    return args;
}

std::expected<settings::Settings, std::error_code>
resolve_settings(const CliArgs& args) noexcept {
    settings::Settings s;
    if (!args.config_file.empty()) {
        auto loaded = settings::load_settings(args.config_file);
        if (!loaded) return std::unexpected(loaded.error());
        s = std::move(*loaded);
    }

    if (!args.api_url.empty()) s.http.api_base_url = args.api_url;
    if (args.max_files > 0) s.queue.max_concurrent_files = args.max_files;
    if (args.max_chunks > 0) s.queue.max_concurrent_chunks = args.max_chunks;
    if (args.priority_mode) s.queue.priority_mode = *args.priority_mode;

    // A fixed command-line band must not be overridden by adaptation
    if (args.max_files > 0 || args.max_chunks > 0) {
        s.queue.adaptive_optimization = false;
        s.queue.network_optimization = false;
    }

    if (args.verbose) s.log.level = spdlog::level::debug;
    if (args.quiet) s.log.level = spdlog::level::err;
    return s;
}

//=============================================================================
// Commands
//=============================================================================

CliResult upload(const CliArgs& args) noexcept {
    auto resolved = resolve_settings(args);
    if (!resolved) {
        std::cerr << "Error: " << args.config_file << ": " << resolved.error().message() << std::endl;
        return std::unexpected(resolved.error());
    }
    const auto& s = *resolved;

    if (auto ec = log::init(s.log)) {
        std::cerr << "Warning: logging setup failed: " << ec.message() << std::endl;
    }

    if (!args.dry_run && s.http.api_base_url.empty()) {
        std::cerr << "Error: No API URL specified (use --api or a settings file)" << std::endl;
        return std::unexpected(make_error_code(core::UploadErrc::invalid_config));
    }

    // Open every file up front so a typo fails before anything is sent
    std::vector<core::PayloadHandle> payloads;
    std::uint64_t total_bytes = 0;
    for (const auto& path : args.files) {
        auto payload = disk::FilePayload::open(path);
        if (!payload) {
            std::cerr << "Error: " << path << ": " << payload.error().message() << std::endl;
            return std::unexpected(payload.error());
        }
        total_bytes += (*payload)->size();
        payloads.push_back(std::move(*payload));
    }

    try {
        boost::asio::io_context io;

        std::unique_ptr<core::Transport> transport;
        if (args.dry_run) {
            auto mock = std::make_unique<core::MockTransport>(io.get_executor());
            mock->latency(DRY_RUN_LATENCY);
            transport = std::move(mock);
        } else {
            net::HttpTransport::global_init();
            transport = std::make_unique<net::HttpTransport>(s.http);
        }

        std::shared_ptr<core::NetworkSampler> sampler;
        if (args.network) {
            sampler = std::make_shared<core::ManualSampler>(core::NetworkSample{*args.network, 0, {}, true});
        }

        int exit_code = 1;
        {
            core::QueueCoordinator coordinator(io.get_executor(), *transport, s.queue, s.engine, sampler);

            Aggregate agg;
            ProgressBar bar(total_bytes, "Uploading");
            bool interrupted = false;

            coordinator.subscribe(core::EventKind::upload_progress, [&](const core::Event& e) {
                const auto& p = std::get<core::UploadProgress>(e);
                agg.uploaded[p.task_id] = p.uploaded_bytes;
                agg.speed[p.task_id] = p.speed_bps;
                if (!args.quiet) bar.update(agg.total_uploaded(), agg.total_speed());
            });

            coordinator.subscribe(core::EventKind::upload_completed, [&](const core::Event& e) {
                const auto& c = std::get<core::UploadCompleted>(e);
                ++agg.completed;
                agg.uploaded[c.task_id] = c.size;
                agg.speed.erase(c.task_id);
                if (!args.quiet) bar.files(agg.completed, payloads.size());
                if (args.verbose) {
                    bar.clear();
                    std::cout << "Uploaded " << c.name << " (" << ProgressBar::format_bytes(c.size)
                              << ") -> " << c.result.location << std::endl;
                }
            });

            coordinator.subscribe(core::EventKind::upload_error, [&](const core::Event& e) {
                const auto& err = std::get<core::UploadError>(e);
                ++agg.failed;
                agg.speed.erase(err.task_id);
                if (!args.quiet) bar.clear();
                std::cerr << "Error: " << agg.name(err.task_id) << ": "
                          << core::to_string(err.error.kind) << ": " << err.error.message << std::endl;
            });

            coordinator.subscribe(core::EventKind::upload_cancelled, [&](const core::Event& e) {
                ++agg.cancelled;
                agg.speed.erase(std::get<core::UploadCancelled>(e).task_id);
            });

            if (args.verbose) {
                coordinator.subscribe(core::EventKind::network_change, [&](const core::Event& e) {
                    const auto& n = std::get<core::NetworkChange>(e);
                    bar.clear();
                    std::cout << "Network: " << core::to_string(n.previous_type) << " -> "
                              << core::to_string(n.metrics.effective_type)
                              << (n.metrics.online ? "" : " (offline)") << std::endl;
                });
            }

            coordinator.subscribe(core::EventKind::queue_empty, [&](const core::Event&) {
                io.stop();
            });

            boost::asio::signal_set signals(io, SIGINT, SIGTERM);
            signals.async_wait([&](const boost::system::error_code& ec, int) {
                if (ec) return;
                interrupted = true;
                if (!args.quiet) bar.clear();
                std::cerr << "Interrupted, cancelling uploads" << std::endl;
                coordinator.shutdown();
                io.stop();
            });

            core::SessionContext session{args.session_id, args.token, {}};
            std::size_t submitted = 0;
            for (auto& payload : payloads) {
                auto name = payload->name();
                auto id = coordinator.submit(std::move(payload), session);
                if (!id) {
                    std::cerr << "Error: " << name << ": " << id.error().message() << std::endl;
                    ++agg.failed;
                    continue;
                }
                agg.names[*id] = std::move(name);
                ++submitted;
            }

            if (submitted > 0) {
                io.run();
            }

            if (!args.quiet && agg.failed == 0 && !interrupted && submitted > 0) {
                bar.finish();
            }

            exit_code = (agg.failed == 0 && !interrupted && agg.completed == payloads.size()) ? 0 : 1;
            if (args.verbose) {
                std::cout << agg.completed << " completed, " << agg.failed << " failed, "
                          << agg.cancelled << " cancelled" << std::endl;
            }
        }

        transport.reset();
        if (!args.dry_run) {
            net::HttpTransport::global_cleanup();
        }
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(core::UploadErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Uplift " << program_name << " - Chunked multipart uploader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <FILE>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -V, --verbose              Enable verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (no progress bar)\n";
    std::cout << "  -c, --config <FILE>        Read settings from a JSON file\n";
    std::cout << "  -a, --api <URL>            Upload API base URL\n";
    std::cout << "  -s, --session <ID>         Session to upload into\n";
    std::cout << "  -t, --token <TOKEN>        Bearer token for the API\n";
    std::cout << "  -f, --max-files <N>        Concurrent files (disables adaptation)\n";
    std::cout << "  -k, --max-chunks <N>       Concurrent chunks per file (disables adaptation)\n";
    std::cout << "  -p, --priority-mode <M>    fifo, smallest-first or largest-first\n";
    std::cout << "  -n, --network <TYPE>       Report network as slow-2g, 2g, 3g or 4g\n";
    std::cout << "      --dry-run              Upload to an in-process mock store\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " -a https://example.com/api -s 42 -t TOKEN lecture.mp4\n";
    std::cout << "  " << program_name << " --dry-run -n 3g *.mp4\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
}

void print_version() noexcept {
    std::cout << "Uplift " << uplift::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << "\n";
    std::cout << "\n";
    std::cout << "Built with C++23, Boost.Asio, libcurl, spdlog\n";
}

} // namespace uplift::cli
