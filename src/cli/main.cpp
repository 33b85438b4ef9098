#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static bool is_number(const std::string &s)
{
    if (s.empty() || s.size() > 10)
        return false;
    for (unsigned char c : s)
        if (c < '0' || c > '9')
            return false;
    return true;
}

static bool is_valid_expiry(const std::string &e)
{
    if (e == "readonce" || e == "permanent")
        return true;
    return is_number(e) && std::strtoul(e.c_str(), nullptr, 10) > 0;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  glyphctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  send [--expire <seconds>|readonce|permanent] [--window <seconds>] <text...>\n"
                         "  scan <code>\n"
                         "  open\n"
                         "  dismiss\n"
                         "  save\n"
                         "  close\n"
                         "  status\n"
                         "  reset\n"
                         "  stop\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");
        return exitc::bad_args;
    }
    if (line.size() >= ipc::MAX_LINE)
    {
        std::fprintf(stderr, "error: command line longer than %zu bytes\n", ipc::MAX_LINE);
        return exitc::bad_args;
    }
    std::string out = line;
    out.push_back('\n');
    if (!ipc::send_line(sock, out))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

// send [--expire E] [--window S] <text...>  ->  "SEND E S text"
static int build_send(const std::vector<std::string>                &args,
                      const std::function<int(const std::string &)> &send_line)
{
    std::string expire = "30";
    std::string window = "0";
    size_t      i      = 1;
    for (; i < args.size(); ++i)
    {
        if (args[i] == "--expire" && i + 1 < args.size())
            expire = args[++i];
        else if (args[i] == "--window" && i + 1 < args.size())
            window = args[++i];
        else
            break;
    }
    if (!is_valid_expiry(expire))
    {
        std::fprintf(stderr, "error: --expire expects seconds > 0, 'readonce' or 'permanent'\n");
        return exitc::bad_args;
    }
    if (!is_number(window))
    {
        std::fprintf(stderr, "error: --window expects whole seconds\n");
        return exitc::bad_args;
    }

    std::string text;
    for (; i < args.size(); ++i)
    {
        if (!text.empty())
            text.push_back(' ');
        text += args[i];
    }
    if (text.find_first_not_of(" \t") == std::string::npos)
    {
        print_usage();
        return exitc::bad_args;
    }
    return send_line("SEND " + expire + " " + window + " " + text);
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    auto bare = [&](const char *line) {
        return [&send_line, &args, line]() -> int {
            if (args.size() != 1)
            {
                print_usage();
                return exitc::bad_args;
            }
            return send_line(line);
        };
    };

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"send", [&]() -> int { return build_send(args, send_line); }},
        {"scan",
         [&]() -> int {
             if (args.size() != 2 || args[1].empty())
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("SCAN " + args[1]);
         }},
        {"open", bare("OPEN")},
        {"dismiss", bare("DISMISS")},
        {"save", bare("SAVE")},
        {"close", bare("CLOSE")},
        {"status", bare("STATUS")},
        {"reset", bare("RESET")},
        {"stop", bare("STOP")},
        {"quit", bare("QUIT")},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    // CLI --sock overrides GLYPH_CTL_SOCK
    std::string sock;

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (args.empty() && (a == "--help" || a == "-h"))
        {
            print_usage();
            return exitc::ok;
        }
        if (args.empty() && a == "--sock" && i + 1 < argc)
            sock = ipc::expand_user(argv[++i]);
        else
            args.push_back(std::move(a));
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (sock.empty())
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
