#include "cli.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace
{
    double to_double(const std::string &flag, const std::string &v)
    {
        std::size_t pos = 0;
        double d = 0.0;
        try
        {
            d = std::stod(v, &pos);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument(flag + ": not a number: '" + v + "'");
        }
        if (pos != v.size())
            throw std::invalid_argument(flag + ": not a number: '" + v + "'");
        return d;
    }

    std::size_t to_size(const std::string &flag, const std::string &v)
    {
        if (v.empty() || v[0] == '-')
            throw std::invalid_argument(flag + ": not a non-negative integer: '" + v + "'");
        std::size_t pos = 0;
        unsigned long long n = 0;
        try
        {
            n = std::stoull(v, &pos);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument(flag + ": not a non-negative integer: '" + v + "'");
        }
        if (pos != v.size())
            throw std::invalid_argument(flag + ": not a non-negative integer: '" + v + "'");
        return static_cast<std::size_t>(n);
    }
}

Args parse(int argc, char **argv)
{
    std::vector<std::string> v;
    for (int i = 1; i < argc; ++i)
        v.emplace_back(argv[i]);
    return parse(v);
}

Args parse(const std::vector<std::string> &argv)
{
    Args a;
    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        const std::string &s = argv[i];
        auto next = [&]() -> const std::string &
        {
            if (i + 1 >= argv.size())
                throw std::invalid_argument(s + ": missing value");
            return argv[++i];
        };
        if (s == "--growth")
            a.growth = to_double(s, next());
        else if (s == "--limit")
            a.limit = to_size(s, next());
        else if (s == "--no-limit")
            a.limit.reset();
        else if (s == "--ticks")
            a.ticks = to_size(s, next());
        else if (s == "--grace")
            a.grace_s = to_double(s, next());
        else if (s == "--grid")
            a.grid = to_size(s, next());
        else if (s == "--cell")
            a.cell_px = to_size(s, next());
        else if (s == "--record")
            a.record_dir = next();
        else if (s == "--stream")
            a.stream_path = next();
        else if (s == "--every")
            a.every = to_size(s, next());
        else if (s == "--report")
            a.report = to_size(s, next());
        else if (s == "--csv")
            a.csv = true;
        else if (s == "--quiet")
            a.quiet = true;
        else if (s == "--help" || s == "-h")
            a.help = true;
        else if (!s.empty() && s[0] != '-')
            a.growth = to_double("growth", s); // bare growth factor
        else
            throw std::invalid_argument("unknown option: " + s);
    }
    return a;
}

std::optional<std::string> validate(const Args &a)
{
    if (!(a.growth > 1.0))
        return std::string("growth factor must be greater than 1");
    if (a.limit && *a.limit < 1)
        return std::string("limit must be at least 1");
    if (a.grid < 1)
        return std::string("grid must be at least 1");
    if (a.cell_px < 1)
        return std::string("cell size must be at least 1 pixel");
    if (a.grid > kMaxBoardPixels || a.cell_px > kMaxBoardPixels / a.grid)
        return std::string("board too large: grid * cell must not exceed 32768 pixels");
    if (a.every < 1)
        return std::string("capture interval must be at least 1");
    if (!std::isfinite(a.grace_s))
        return std::string("grace period must be a finite number");
    if (a.grace_s < 0.0)
        return std::string("grace period cannot be negative");
    if (a.grace_s > kMaxGraceSeconds)
        return std::string("grace period too long");
    if (!a.record_dir.empty() && !a.stream_path.empty())
        return std::string("--record and --stream are mutually exclusive");
    if (a.csv && a.stream_path == "-")
        return std::string("--csv and --stream - both write to stdout");
    return std::nullopt;
}

void print_usage(const char *prog)
{
    std::fprintf(stderr,
                 "usage: %s [growth] [options]\n"
                 "  --growth F     capacity multiplier on expansion (default 2.0)\n"
                 "  --limit N      hard capacity limit (default 262144)\n"
                 "  --no-limit     grow without a hard limit\n"
                 "  --ticks N      stop after N ticks (default: until stopped)\n"
                 "  --grace S      seconds to keep running after the limit is reached (default 3)\n"
                 "  --grid N       cells per side of the board (default 512)\n"
                 "  --cell PX      pixels per cell side (default 2)\n"
                 "  --record DIR   write each captured frame as DIR/frame_NNNNNN.ppm\n"
                 "  --stream PATH  write captured frames as one PPM stream (- for stdout)\n"
                 "  --every N      capture every Nth tick (default 1)\n"
                 "  --report N     status line every N ticks, 0 to disable (default 64)\n"
                 "  --csv          print a snapshot row per tick on stdout\n"
                 "  --quiet        no status lines\n",
                 prog);
}

std::vector<double> parse_list(const std::string &v)
{
    std::vector<double> out;
    std::size_t start = 0;
    while (true)
    {
        auto pos = v.find(',', start);
        std::string tok = (pos == std::string::npos) ? v.substr(start) : v.substr(start, pos - start);
        if (!tok.empty())
            out.push_back(to_double("list", tok));
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return out;
}
