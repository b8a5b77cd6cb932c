#pragma once

#include <cstddef>

struct wl_shm;
struct wl_buffer;

namespace whichkey::wayland {

/**
 * ARGB8888 pixel buffer in shared memory, handed to the compositor as a
 * wl_buffer. Busy from attach until the compositor releases it.
 */
class ShmBuffer {
public:
    // Throws std::system_error when the shared memory cannot be set up
    ShmBuffer(wl_shm* shm, int width, int height);
    ~ShmBuffer();

    ShmBuffer(const ShmBuffer&) = delete;
    ShmBuffer& operator=(const ShmBuffer&) = delete;

    wl_buffer* buffer() const { return buffer_; }
    unsigned char* data() const { return data_; }
    int width() const { return width_; }
    int height() const { return height_; }
    int stride() const { return stride_; }

    bool busy() const { return busy_; }
    void mark_busy() { busy_ = true; }

private:
    static void handle_release(void* data, wl_buffer* buffer);

    wl_buffer* buffer_ = nullptr;
    unsigned char* data_ = nullptr;
    size_t size_ = 0;
    int width_;
    int height_;
    int stride_;
    bool busy_ = false;
};

}  // namespace whichkey::wayland
