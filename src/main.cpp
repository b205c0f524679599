#include "copy/directory_copier.hpp"
#include "copy/file_copier.hpp"
#include "copy/progress_channel.hpp"
#include "copy/progress_sinks.hpp"
#include "util/byte_size.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "walk/file_finder.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

const char *g_prog = "treecopy";

struct GlobalOptions {
    std::string config_path = treecopy::config::kDefaultConfigPath;
    bool config_explicit = false;
    bool verbose = false;
    std::optional<bool> progress;
    std::optional<std::string> progress_file;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> channel_capacity;
    bool verify = false;
    bool preserve_mode = false;
    bool fsync = false;
};

void PrintUsage(const char *argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] copy <src> <dst>\n"
        "   %s [options] find <root> [-g <glob> | -r <regex>] [-n] [-i]\n"
        "   %s [options] size <root> [-H]\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>       JSON config file (default %s)\n"
        "  -v, --verbose             Debug logging\n"
        "  -q, --quiet               No console progress\n"
        "  -p, --progress-file <p>   Write JSON progress state to <p>\n"
        "  -s, --chunk-size <n>      Copy chunk size, e.g. 65536, 64K, 1M\n"
        "  -b, --capacity <n>        Progress queue bound, 0 = unbounded\n"
        "      --verify              Compare SHA-256 of every copied file\n"
        "      --preserve-mode       Copy permission bits\n"
        "      --fsync               fsync every destination file\n"
        "  -h, --help                Show this help\n"
        "\n"
        "find options:\n"
        "  -g, --glob <pattern>      Match file names against a glob\n"
        "  -r, --regex <pattern>     Match file names against a regex (always recursive)\n"
        "  -n, --no-recursive        Only look at the root's direct children\n"
        "  -i, --ignore-case         Case-insensitive glob matching\n"
        "\n"
        "size options:\n"
        "  -H, --human               Print a human-readable size\n",
        argv0, argv0, argv0, treecopy::config::kDefaultConfigPath);
}

bool ParseCount(const char *flag, const char *text, std::uint64_t &out) {
    auto parsed = treecopy::ParseByteCount(text);
    if (!parsed) {
        std::fprintf(stderr, "Invalid %s: %s\n", flag, parsed.error().c_str());
        return false;
    }
    out = *parsed;
    return true;
}

// Consumes events on the calling thread while `run` produces them on a worker.
treecopy::Result RunWithProgress(const std::function<treecopy::Result(treecopy::IProgressSink *)> &run,
                                 const std::string &label,
                                 bool console,
                                 const std::optional<std::string> &progress_file,
                                 std::size_t capacity) {
    if (!console && !progress_file) {
        return run(nullptr);
    }

    std::unique_ptr<treecopy::ConsoleProgressSink> console_sink;
    if (console) console_sink = std::make_unique<treecopy::ConsoleProgressSink>(label);
    std::unique_ptr<treecopy::FileProgressSink> file_sink;
    if (progress_file) file_sink = std::make_unique<treecopy::FileProgressSink>(*progress_file);

    treecopy::ProgressChannel channel(capacity);
    treecopy::Result result;
    std::thread worker([&] {
        treecopy::Logger::SetThreadTag("worker");
        result = run(&channel);
        channel.CloseSender();
    });

    while (auto ev = channel.Receive()) {
        if (console_sink && !console_sink->Send(*ev)) console_sink.reset();
        if (file_sink && !file_sink->Send(*ev)) {
            LogWarn("Progress file %s is not writable, no longer updating it",
                    progress_file->c_str());
            file_sink.reset();
        }
        if (!console_sink && !file_sink) {
            channel.CloseReceiver();
            break;
        }
    }

    worker.join();
    treecopy::ClearProgressLine();
    return result;
}

int RunCopy(const GlobalOptions &g,
            const treecopy::config::TreecopyConfigFromFile &cfg,
            int argc,
            char **argv) {
    if (argc != 3) {
        PrintUsage(g_prog);
        return 2;
    }
    const std::string src = argv[1];
    std::string dst = argv[2];

    treecopy::CopyOptions opt{};
    const std::uint64_t chunk =
        g.chunk_size.value_or(cfg.chunk_size_bytes.value_or(treecopy::kDefaultChunkSize));
    if (chunk == 0 || chunk > treecopy::kMaxChunkSize) {
        std::fprintf(stderr, "Invalid --chunk-size: must be between 1 and %zu bytes\n",
                     treecopy::kMaxChunkSize);
        return 2;
    }
    opt.chunk_size_bytes = static_cast<std::size_t>(chunk);
    opt.verify = g.verify || cfg.verify.value_or(false);
    opt.preserve_mode = g.preserve_mode || cfg.preserve_mode.value_or(false);
    opt.fsync = g.fsync || cfg.fsync.value_or(false);

    const bool console = g.progress.value_or(cfg.progress.value_or(true));
    const std::optional<std::string> progress_file = g.progress_file ? g.progress_file : cfg.progress_file;
    const std::size_t capacity =
        static_cast<std::size_t>(g.channel_capacity.value_or(cfg.channel_capacity.value_or(64)));

    std::error_code ec;
    const bool src_is_dir = std::filesystem::is_directory(src, ec);

    treecopy::Result res;
    if (src_is_dir) {
        const treecopy::DirectoryCopier copier(opt);
        res = RunWithProgress(
            [&](treecopy::IProgressSink *sink) { return copier.Copy(src, dst, sink); },
            "copy", console, progress_file, capacity);
    } else {
        if (std::filesystem::is_directory(dst, ec)) {
            dst = treecopy::JoinPath(dst, treecopy::FileNameOf(src));
        }
        const treecopy::FileCopier copier(opt);
        res = RunWithProgress(
            [&](treecopy::IProgressSink *sink) { return copier.Copy(src, dst, sink); },
            "copy", console, progress_file, capacity);
        if (res.ok) LogInfo("Copied %s -> %s", src.c_str(), dst.c_str());
    }

    if (!res.ok) {
        LogError("%s", res.msg.c_str());
        return 1;
    }
    return 0;
}

int RunFind(int argc, char **argv) {
    treecopy::FindOptions opt{};
    std::optional<std::string> regex;

    static option long_opts[] = {
        {"glob", required_argument, nullptr, 'g'},
        {"regex", required_argument, nullptr, 'r'},
        {"no-recursive", no_argument, nullptr, 'n'},
        {"ignore-case", no_argument, nullptr, 'i'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;  // full getopt reset for the subcommand
    int c;
    while ((c = getopt_long(argc, argv, "g:r:ni", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'g': opt.pattern = optarg; break;
            case 'r': regex = optarg; break;
            case 'n': opt.recursive = false; break;
            case 'i': opt.case_sensitive = false; break;
            default:
                PrintUsage(g_prog);
                return 2;
        }
    }
    if (optind + 1 != argc || (opt.pattern && regex)) {
        PrintUsage(g_prog);
        return 2;
    }
    const std::string root = argv[optind];

    std::vector<std::string> found;
    const treecopy::Result res = regex ? treecopy::FindFilesRegex(root, *regex, found)
                                       : treecopy::FindFiles(root, opt, found);
    if (!res.ok) {
        LogError("%s", res.msg.c_str());
        return 1;
    }
    for (const auto &path : found) {
        std::printf("%s\n", path.c_str());
    }
    LogDebug("%zu file(s) found under %s", found.size(), root.c_str());
    return 0;
}

int RunSize(int argc, char **argv) {
    bool human = false;

    static option long_opts[] = {
        {"human", no_argument, nullptr, 'H'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;  // full getopt reset for the subcommand
    int c;
    while ((c = getopt_long(argc, argv, "H", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'H': human = true; break;
            default:
                PrintUsage(g_prog);
                return 2;
        }
    }
    if (optind + 1 != argc) {
        PrintUsage(g_prog);
        return 2;
    }
    const std::string root = argv[optind];

    if (human) {
        std::string size;
        if (auto r = treecopy::DirectorySizeHuman(root, size); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        std::printf("%s\n", size.c_str());
    } else {
        std::uint64_t size = 0;
        if (auto r = treecopy::DirectorySize(root, size); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        std::printf("%llu\n", (unsigned long long)size);
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    g_prog = argv[0];
    GlobalOptions g{};

    enum { kOptVerify = 1000, kOptPreserveMode, kOptFsync };
    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"progress-file", required_argument, nullptr, 'p'},
        {"chunk-size", required_argument, nullptr, 's'},
        {"capacity", required_argument, nullptr, 'b'},
        {"verify", no_argument, nullptr, kOptVerify},
        {"preserve-mode", no_argument, nullptr, kOptPreserveMode},
        {"fsync", no_argument, nullptr, kOptFsync},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int c;
    // '+' stops at the subcommand so its own options are left for it.
    while ((c = getopt_long(argc, argv, "+hc:vqp:s:b:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(g_prog);
                return 0;
            case 'c':
                g.config_path = optarg;
                g.config_explicit = true;
                break;
            case 'v': g.verbose = true; break;
            case 'q': g.progress = false; break;
            case 'p': g.progress_file = optarg; break;
            case 's': {
                std::uint64_t v = 0;
                if (!ParseCount("--chunk-size", optarg, v)) return 2;
                g.chunk_size = v;
                break;
            }
            case 'b': {
                std::uint64_t v = 0;
                if (!ParseCount("--capacity", optarg, v)) return 2;
                g.channel_capacity = v;
                break;
            }
            case kOptVerify: g.verify = true; break;
            case kOptPreserveMode: g.preserve_mode = true; break;
            case kOptFsync: g.fsync = true; break;
            default:
                PrintUsage(g_prog);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(g_prog);
        return 2;
    }

    treecopy::config::TreecopyConfigFromFile cfg;
    std::error_code ec;
    if (g.config_explicit || std::filesystem::exists(g.config_path, ec)) {
        if (auto r = cfg.LoadFile(g.config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    }

    if (cfg.log_level) {
        treecopy::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (g.verbose) {
        treecopy::Logger::Instance().SetLevel(treecopy::LogLevel::Debug);
    }

    const std::string command = argv[optind];
    const int sub_argc = argc - optind;
    char **sub_argv = argv + optind;

    if (command == "copy") return RunCopy(g, cfg, sub_argc, sub_argv);
    if (command == "find") return RunFind(sub_argc, sub_argv);
    if (command == "size") return RunSize(sub_argc, sub_argv);

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(g_prog);
    return 2;
}
