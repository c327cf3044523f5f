#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "snapshot.hpp"

enum class CellKind
{
    Unallocated, // past capacity
    Free,        // allocated, not yet holding an element
    PendingOld,  // old generation, not migrated yet
    MigratedOld, // old generation, already migrated
    New          // admitted since the last expansion
};

// Half-open ranges over [0, capacity): [0, migrated) migrated old,
// [migrated, old_gen) pending old, [old_gen, size) new, [size, capacity) free.
CellKind classify_cell(const Snapshot &s, std::size_t index);

struct Rgb
{
    std::uint8_t r, g, b;
};

Rgb cell_color(CellKind k);

// Packed 8-bit RGB raster.
class Frame
{
public:
    Frame(std::size_t width, std::size_t height, Rgb fill);

    std::size_t width() const { return w_; }
    std::size_t height() const { return h_; }
    const std::vector<std::uint8_t> &pixels() const { return px_; }

    void fill_rect(std::size_t x, std::size_t y, std::size_t w, std::size_t h, Rgb c);
    Rgb at(std::size_t x, std::size_t y) const;

private:
    std::size_t w_, h_;
    std::vector<std::uint8_t> px_;
};

struct FrameLayout
{
    std::size_t grid = 512;  // cells per row and per column
    std::size_t cell_px = 2; // pixels per cell side
    std::size_t panel_px = 48;
};

// Draws the cell board on the left and an efficiency gauge in the side panel.
Frame render_frame(const Snapshot &s, const FrameLayout &layout);

// Binary PPM (P6) output. Directory mode writes one numbered file per frame;
// stream mode appends every frame to one file ("-" is stdout), which video
// encoders read as an image pipe. Closed exactly once.
class FrameSink
{
public:
    enum class Mode
    {
        Directory,
        Stream
    };

    FrameSink(Mode mode, std::string path);
    ~FrameSink();

    FrameSink(const FrameSink &) = delete;
    FrameSink &operator=(const FrameSink &) = delete;

    void write(const Frame &f);
    void close();

    bool is_open() const { return open_; }
    std::size_t frames_written() const { return frames_; }

private:
    void write_ppm(std::FILE *fp, const Frame &f);

    Mode mode_;
    std::string path_;
    std::FILE *stream_ = nullptr;
    bool owns_stream_ = false;
    bool open_ = false;
    std::size_t frames_ = 0;
};

std::string frame_file_name(std::size_t index);
