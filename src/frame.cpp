#include "frame.hpp"
#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>

CellKind classify_cell(const Snapshot &s, std::size_t index)
{
    if (index >= s.capacity)
        return CellKind::Unallocated;
    if (index < s.migrated)
        return CellKind::MigratedOld;
    if (index < s.old_generation_size)
        return CellKind::PendingOld;
    if (index < s.size)
        return CellKind::New;
    return CellKind::Free;
}

Rgb cell_color(CellKind k)
{
    switch (k)
    {
    case CellKind::Unallocated:
        return {128, 128, 128};
    case CellKind::Free:
        return {0, 0, 0};
    case CellKind::PendingOld:
        return {0, 0, 255};
    case CellKind::MigratedOld:
        return {0, 160, 160};
    case CellKind::New:
        return {0, 255, 0};
    }
    return {255, 0, 255};
}

static std::size_t pixel_bytes(std::size_t width, std::size_t height)
{
    const std::size_t max = std::numeric_limits<std::size_t>::max();
    if (width != 0 && height > max / 3 / width)
        throw std::length_error("frame too large");
    return width * height * 3;
}

Frame::Frame(std::size_t width, std::size_t height, Rgb fill)
    : w_(width), h_(height), px_(pixel_bytes(width, height))
{
    fill_rect(0, 0, w_, h_, fill);
}

void Frame::fill_rect(std::size_t x, std::size_t y, std::size_t w, std::size_t h, Rgb c)
{
    std::size_t x1 = std::min(x + w, w_);
    std::size_t y1 = std::min(y + h, h_);
    for (std::size_t j = y; j < y1; ++j)
    {
        for (std::size_t i = x; i < x1; ++i)
        {
            std::uint8_t *p = px_.data() + (j * w_ + i) * 3;
            p[0] = c.r;
            p[1] = c.g;
            p[2] = c.b;
        }
    }
}

Rgb Frame::at(std::size_t x, std::size_t y) const
{
    const std::uint8_t *p = px_.data() + (y * w_ + x) * 3;
    return {p[0], p[1], p[2]};
}

Frame render_frame(const Snapshot &s, const FrameLayout &layout)
{
    const std::size_t board = layout.grid * layout.cell_px;
    Frame f(board + layout.panel_px, board, cell_color(CellKind::Unallocated));

    // only allocated cells are drawn; the rest keep the background
    const std::size_t cells = std::min(s.capacity, layout.grid * layout.grid);
    for (std::size_t index = 0; index < cells; ++index)
    {
        std::size_t x = index % layout.grid;
        std::size_t y = index / layout.grid;
        f.fill_rect(x * layout.cell_px, y * layout.cell_px, layout.cell_px, layout.cell_px,
                    cell_color(classify_cell(s, index)));
    }

    if (layout.panel_px > 0)
    {
        const Rgb white{255, 255, 255};
        f.fill_rect(board, 0, layout.panel_px, board, white);
        double e = std::clamp(s.efficiency, 0.0, 1.0);
        std::size_t bar = static_cast<std::size_t>(e * static_cast<double>(board));
        f.fill_rect(board + layout.panel_px / 4, board - bar, layout.panel_px / 2, bar,
                    cell_color(CellKind::New));
    }
    return f;
}

std::string frame_file_name(std::size_t index)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "frame_%06zu.ppm", index);
    return buf;
}

FrameSink::FrameSink(Mode mode, std::string path)
    : mode_(mode), path_(std::move(path))
{
    if (mode_ == Mode::Stream)
    {
        if (path_ == "-")
        {
            stream_ = stdout;
        }
        else
        {
            stream_ = std::fopen(path_.c_str(), "wb");
            if (!stream_)
                throw std::runtime_error("cannot open frame stream: " + path_);
            owns_stream_ = true;
        }
    }
    else
    {
        std::error_code ec;
        std::filesystem::create_directories(path_, ec);
        if (ec)
            throw std::runtime_error("cannot create frame directory: " + path_ + ": " + ec.message());
    }
    open_ = true;
}

FrameSink::~FrameSink()
{
    if (!open_)
        return;
    // destructor must not throw; an explicit close() reports errors
    if (stream_)
    {
        if (owns_stream_)
            std::fclose(stream_);
        else
            std::fflush(stream_);
    }
    stream_ = nullptr;
    open_ = false;
}

void FrameSink::write(const Frame &f)
{
    if (!open_)
        throw std::logic_error("frame sink already closed");
    if (mode_ == Mode::Stream)
    {
        write_ppm(stream_, f);
    }
    else
    {
        std::string file = path_ + "/" + frame_file_name(frames_);
        std::FILE *fp = std::fopen(file.c_str(), "wb");
        if (!fp)
            throw std::runtime_error("cannot open frame file: " + file);
        try
        {
            write_ppm(fp, f);
        }
        catch (const std::runtime_error &)
        {
            std::fclose(fp);
            throw;
        }
        if (std::fclose(fp) != 0)
            throw std::runtime_error("cannot close frame file: " + file);
    }
    ++frames_;
}

void FrameSink::close()
{
    if (!open_)
        return;
    open_ = false;
    std::FILE *fp = stream_;
    stream_ = nullptr;
    if (!fp)
        return;
    int rc = owns_stream_ ? std::fclose(fp) : std::fflush(fp);
    if (rc != 0)
        throw std::runtime_error("cannot flush frame stream: " + path_);
}

void FrameSink::write_ppm(std::FILE *fp, const Frame &f)
{
    const auto &px = f.pixels();
    if (std::fprintf(fp, "P6\n%zu %zu\n255\n", f.width(), f.height()) < 0 ||
        std::fwrite(px.data(), 1, px.size(), fp) != px.size())
        throw std::runtime_error("short write to frame output: " + path_);
}
