#include "wayland/ShmBuffer.hpp"
#include <cerrno>
#include <sys/mman.h>
#include <system_error>
#include <unistd.h>
#include <wayland-client.h>

namespace whichkey::wayland {

void ShmBuffer::handle_release(void* data, wl_buffer*) {
    static_cast<ShmBuffer*>(data)->busy_ = false;
}

ShmBuffer::ShmBuffer(wl_shm* shm, int width, int height)
    : width_(width), height_(height), stride_(width * 4) {
    static const wl_buffer_listener listener = {
        .release = &ShmBuffer::handle_release,
    };

    size_ = static_cast<size_t>(stride_) * static_cast<size_t>(height_);

    int fd = memfd_create("whichkey-shm", MFD_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "memfd_create");
    }
    if (ftruncate(fd, static_cast<off_t>(size_)) < 0) {
        int err = errno;
        close(fd);
        throw std::system_error(err, std::generic_category(), "ftruncate");
    }

    void* data = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    if (data == MAP_FAILED) {
        int err = errno;
        close(fd);
        throw std::system_error(err, std::generic_category(), "mmap");
    }
    data_ = static_cast<unsigned char*>(data);

    wl_shm_pool* pool = wl_shm_create_pool(shm, fd, static_cast<int32_t>(size_));
    buffer_ = wl_shm_pool_create_buffer(pool, 0, width_, height_, stride_, WL_SHM_FORMAT_ARGB8888);
    wl_shm_pool_destroy(pool);
    close(fd);

    wl_buffer_add_listener(buffer_, &listener, this);
}

ShmBuffer::~ShmBuffer() {
    if (buffer_) {
        wl_buffer_destroy(buffer_);
    }
    if (data_) {
        munmap(data_, size_);
    }
}

}  // namespace whichkey::wayland
