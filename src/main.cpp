// main.cpp - Main entry point
#include <getopt.h>
#include <unistd.h>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include "conf/config.hpp"
#include "core/errors.hpp"
#include "core/executor.hpp"
#include "core/ioutil.hpp"
#include "core/planner.hpp"
#include "core/symlink.hpp"
#include "defs.hpp"
#include "mount/mountfs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace layerfs;

struct CliOptions {
    std::string config_file;
    std::string command;
    fs::path log_file;
    bool verbose = false;
    std::vector<std::string> mounts;
    std::string output;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "layerfs " << LAYERFS_VERSION << "\n";
    std::cout << "Usage: layerfs [OPTIONS] <command> [args...]\n\n";
    std::cout << "Filesystem Commands:\n";
    std::cout << "  ls [path]              List a directory\n";
    std::cout << "  tree [path]            List a directory recursively\n";
    std::cout << "  cat <path>             Print a file\n";
    std::cout << "  write <path> <text>    Replace a file's content\n";
    std::cout << "  append <path> <text>   Append to a file\n";
    std::cout << "  mkdir <path>           Create a directory and its parents\n";
    std::cout << "  rm <path>              Remove a file or empty directory\n";
    std::cout << "  rmtree <path>          Remove a tree (mount points stay)\n";
    std::cout << "  mv <from> <to>         Rename within one mount\n";
    std::cout << "  stat <path>            Show entry details\n";
    std::cout << "  chmod <mode> <path>    Change permission bits (octal)\n";
    std::cout << "  ln <target> <link>     Create a symbolic link\n";
    std::cout << "  readlink <path>        Print a link target\n";
    std::cout << "  realpath <path>        Resolve every link in a path\n";
    std::cout << "  mounts                 List mount points\n";
    std::cout << "  run <script>           Run one command per line in one namespace\n\n";

    std::cout << "Configuration Commands (config <subcommand>):\n";
    std::cout << "  config gen             Generate default config file\n";
    std::cout << "  config show            Show current configuration\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -l, --log FILE          Also append log lines to FILE\n";
    std::cout << "  -m, --mount PATH=SRC    Mount SRC at PATH (can be used multiple "
                 "times)\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -o, --output FILE       Output file (for config gen)\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nSources: mem, os:<dir>, readonly:<src>, overlay:<dir>, "
                 "regexp:<pattern>:<src>\n";
    std::cout << "\nExamples:\n";
    std::cout << "  layerfs -m /data=overlay:/srv/data ls /data\n";
    std::cout << "  layerfs -m /tmp=mem run setup.lfs\n";
    std::cout << "  layerfs config show\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"log", required_argument, 0, 'l'},
                                           {"mount", required_argument, 0, 'm'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"output", required_argument, 0, 'o'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:l:m:vo:h", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'l':
            opts.log_file = optarg;
            break;
        case 'm':
            opts.mounts.push_back(optarg);
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'o':
            opts.output = optarg;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    Config config;
    if (!opts.config_file.empty()) {
        config = Config::from_file(opts.config_file);
    } else {
        config = Config::load_default();
    }

    std::vector<MountEntry> cli_mounts;
    for (const auto& arg : opts.mounts) {
        auto entry = parse_mount_arg(arg);
        if (!entry) {
            throw std::runtime_error("Invalid --mount argument: " + arg);
        }
        cli_mounts.push_back(*entry);
    }
    config.merge_with_cli(opts.log_file, opts.verbose, cli_mounts);
    return config;
}

static std::string format_time(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

static std::string type_name(const FileInfo& info) {
    if (info.mount_point)
        return "mount point";
    if (info.is_symlink())
        return "symbolic link";
    return info.is_dir() ? "directory" : "regular file";
}

static void print_entry(const FileInfo& info) {
    std::cout << format_mode(info.is_dir(), info.is_symlink(), info.perms) << " "
              << std::setw(10) << info.size << " " << format_time(info.mod_time) << " "
              << info.name << (info.is_dir() ? "/" : "") << (info.mount_point ? " [mount]" : "")
              << "\n";
}

// Splits a script line into words, double quotes group words
static std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::string cur;
    bool quoted = false;
    bool have_word = false;
    for (char c : line) {
        if (c == '"') {
            quoted = !quoted;
            have_word = true;
        } else if (!quoted && (c == ' ' || c == '\t')) {
            if (have_word) {
                words.push_back(cur);
                cur.clear();
                have_word = false;
            }
        } else {
            cur += c;
            have_word = true;
        }
    }
    if (have_word) {
        words.push_back(cur);
    }
    return words;
}

static std::string join_words(const std::vector<std::string>& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); ++i) {
        if (i > from)
            out += " ";
        out += args[i];
    }
    return out;
}

static bool need_args(const std::string& cmd, const std::vector<std::string>& args, size_t n,
                      const std::string& usage) {
    if (args.size() < n) {
        std::cerr << "Usage: layerfs " << cmd << " " << usage << "\n";
        return false;
    }
    return true;
}

enum class Command {
    LS,
    TREE,
    CAT,
    WRITE,
    APPEND,
    MKDIR,
    RM,
    RMTREE,
    MV,
    STAT,
    CHMOD,
    LN,
    READLINK,
    REALPATH,
    MOUNTS,
    UNKNOWN
};

static Command get_command(const std::string& cmd) {
    if (cmd == "ls")
        return Command::LS;
    if (cmd == "tree")
        return Command::TREE;
    if (cmd == "cat")
        return Command::CAT;
    if (cmd == "write")
        return Command::WRITE;
    if (cmd == "append")
        return Command::APPEND;
    if (cmd == "mkdir")
        return Command::MKDIR;
    if (cmd == "rm")
        return Command::RM;
    if (cmd == "rmtree")
        return Command::RMTREE;
    if (cmd == "mv")
        return Command::MV;
    if (cmd == "stat")
        return Command::STAT;
    if (cmd == "chmod")
        return Command::CHMOD;
    if (cmd == "ln")
        return Command::LN;
    if (cmd == "readlink")
        return Command::READLINK;
    if (cmd == "realpath")
        return Command::REALPATH;
    if (cmd == "mounts")
        return Command::MOUNTS;
    return Command::UNKNOWN;
}

// Runs one filesystem command, FsError propagates to the caller
static int run_command(MountFs& fsys, const std::string& cmd,
                       const std::vector<std::string>& args) {
    switch (get_command(cmd)) {
    case Command::LS: {
        std::string path = args.empty() ? "/" : args[0];
        FileInfo info = fsys.stat(path);
        if (!info.is_dir()) {
            print_entry(info);
            return 0;
        }
        for (const auto& entry : read_dir(fsys, path)) {
            print_entry(entry);
        }
        return 0;
    }
    case Command::TREE: {
        std::string root = args.empty() ? "/" : args[0];
        size_t root_depth = split_path(normalize_path(root)).size();
        walk(fsys, root, [&](const std::string& path, const FileInfo& info) {
            size_t depth = split_path(normalize_path(path)).size() - root_depth;
            std::cout << std::string(depth * 2, ' ')
                      << (depth == 0 ? normalize_path(path) : info.name)
                      << (info.is_dir() && depth > 0 ? "/" : "")
                      << (info.mount_point ? " [mount]" : "") << "\n";
            return true;
        });
        return 0;
    }
    case Command::CAT: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        std::cout << read_file(fsys, args[0]);
        return 0;
    }
    case Command::WRITE: {
        if (!need_args(cmd, args, 2, "<path> <text>"))
            return 1;
        write_file(fsys, args[0], join_words(args, 1) + "\n", DEFAULT_FILE_PERMS);
        return 0;
    }
    case Command::APPEND: {
        if (!need_args(cmd, args, 2, "<path> <text>"))
            return 1;
        append_file(fsys, args[0], join_words(args, 1) + "\n");
        return 0;
    }
    case Command::MKDIR: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        fsys.mkdir_all(args[0], DEFAULT_DIR_PERMS);
        return 0;
    }
    case Command::RM: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        fsys.remove(args[0]);
        return 0;
    }
    case Command::RMTREE: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        fsys.remove_all(args[0]);
        return 0;
    }
    case Command::MV: {
        if (!need_args(cmd, args, 2, "<from> <to>"))
            return 1;
        fsys.rename(args[0], args[1]);
        return 0;
    }
    case Command::STAT: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        auto [info, lstat_called] = lstat_if_possible(fsys, args[0]);
        (void)lstat_called;
        std::cout << "  Name: " << info.name << "\n";
        std::cout << "  Type: " << type_name(info) << "\n";
        std::cout << "  Size: " << info.size << "\n";
        std::cout << "  Mode: " << format_mode(info.is_dir(), info.is_symlink(), info.perms)
                  << "\n";
        std::cout << "  Modified: " << format_time(info.mod_time) << "\n";
        return 0;
    }
    case Command::CHMOD: {
        if (!need_args(cmd, args, 2, "<mode> <path>"))
            return 1;
        unsigned long mode = 0;
        try {
            mode = std::stoul(args[0], nullptr, 8);
        } catch (const std::exception&) {
            std::cerr << "Invalid mode: " << args[0] << "\n";
            return 1;
        }
        fsys.chmod(args[1], static_cast<fs::perms>(mode) & fs::perms::mask);
        return 0;
    }
    case Command::LN: {
        if (!need_args(cmd, args, 2, "<target> <link>"))
            return 1;
        if (!symlink_if_possible(fsys, args[0], args[1])) {
            std::cerr << "Symbolic links are not supported at " << args[1] << "\n";
            return 1;
        }
        return 0;
    }
    case Command::READLINK: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        auto target = readlink_if_possible(fsys, args[0]);
        if (!target) {
            std::cerr << "Symbolic links are not supported at " << args[0] << "\n";
            return 1;
        }
        std::cout << *target << "\n";
        return 0;
    }
    case Command::REALPATH: {
        if (!need_args(cmd, args, 1, "<path>"))
            return 1;
        auto resolved = eval_symlinks(fsys, normalize_path(args[0]));
        std::cout << (resolved ? normalize_path(*resolved) : normalize_path(args[0])) << "\n";
        return 0;
    }
    case Command::MOUNTS: {
        for (const auto& info : fsys.mounts()) {
            std::cout << std::left << std::setw(24) << info.path << " " << info.fs_name << "\n";
        }
        return 0;
    }
    case Command::UNKNOWN:
        break;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return 1;
}

static int run_script(MountFs& fsys, const std::string& script) {
    std::ifstream file(script);
    if (!file.is_open()) {
        std::cerr << "Cannot open script: " << script << "\n";
        return 1;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        auto words = split_words(line);
        if (words.empty() || words[0][0] == '#')
            continue;

        std::string cmd = words[0];
        words.erase(words.begin());
        LOG_DEBUG("run: " + script + ":" + std::to_string(line_no) + ": " + line);

        int ret = 1;
        try {
            ret = run_command(fsys, cmd, words);
        } catch (const FsError& e) {
            std::cerr << script << ":" << line_no << ": " << e.what() << "\n";
            LOG_ERROR(script + ":" + std::to_string(line_no) + ": " + e.what());
        }
        if (ret != 0) {
            return ret;
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.command.empty()) {
            print_help();
            return 0;
        }

        Config config = load_config(cli);

        // Initialize logger globally for all commands
        Logger::getInstance().init(config.verbose, config.log_file);

        if (cli.command == "config") {
            if (cli.args.empty()) {
                std::cerr << "Usage: layerfs config <gen|show>\n";
                return 1;
            }
            std::string subcmd = cli.args[0];

            if (subcmd == "gen") {
                std::string output = cli.output.empty() ? CONFIG_FILENAME : cli.output;
                Config defaults;
                defaults.mounts.push_back({"/tmp", "mem"});
                if (!defaults.save_to_file(output)) {
                    std::cerr << "Failed to write config: " << output << "\n";
                    return 1;
                }
                std::cout << "Generated config: " << output << "\n";
                return 0;
            } else if (subcmd == "show") {
                std::cout << "{\n";
                std::cout << "  \"verbose\": " << (config.verbose ? "true" : "false") << ",\n";
                std::cout << "  \"log_file\": \"" << config.log_file.string() << "\",\n";
                std::cout << "  \"allow_masking\": " << (config.allow_masking ? "true" : "false")
                          << ",\n";
                std::cout << "  \"allow_recursive_mount\": "
                          << (config.allow_recursive_mount ? "true" : "false") << ",\n";
                std::cout << "  \"mounts\": [";
                for (size_t i = 0; i < config.mounts.size(); ++i) {
                    std::cout << "{\"path\": \"" << config.mounts[i].path << "\", \"source\": \""
                              << config.mounts[i].source << "\"}";
                    if (i < config.mounts.size() - 1)
                        std::cout << ", ";
                }
                std::cout << "]\n";
                std::cout << "}\n";
                return 0;
            }
            std::cerr << "Unknown config subcommand: " << subcmd << "\n";
            return 1;
        }

        MountPlan plan = generate_plan(config);
        ExecutionResult exec_result = execute_plan(plan, config);
        for (const auto& target : exec_result.failed) {
            std::cerr << "Warning: mount at " << target << " failed\n";
        }

        if (cli.command == "run") {
            if (cli.args.empty()) {
                std::cerr << "Usage: layerfs run <script>\n";
                return 1;
            }
            return run_script(*exec_result.fs, cli.args[0]);
        }

        return run_command(*exec_result.fs, cli.command, cli.args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
