#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Upper bounds keep durations and frame buffers representable.
constexpr double kMaxGraceSeconds = 1e6;
constexpr std::size_t kMaxBoardPixels = 1u << 15; // per side

struct Args
{
    double growth = 2.0;
    std::optional<std::size_t> limit = std::size_t(512) * 512;
    std::size_t ticks = 0; // 0 = run until stopped
    double grace_s = 3.0;
    std::size_t grid = 512;
    std::size_t cell_px = 2;
    std::string record_dir;  // one PPM per captured frame
    std::string stream_path; // single PPM stream, "-" for stdout
    std::size_t every = 1;
    std::size_t report = 64;
    bool csv = false;
    bool quiet = false;
    bool help = false;
};

// Throws std::invalid_argument on unknown flags or malformed numbers.
Args parse(int argc, char **argv);
Args parse(const std::vector<std::string> &argv);

// Caller-side preconditions for GrowthModel and the renderer.
// Returns an error message, or nullopt when the arguments are usable.
std::optional<std::string> validate(const Args &a);

void print_usage(const char *prog);

// Comma-separated list of numbers, e.g. "1.5,2,3".
std::vector<double> parse_list(const std::string &v);
