#pragma once

#include "config/Config.hpp"
#include "events/Event.hpp"
#include "ui/PangoPainter.hpp"
#include "wayland/Compositor.hpp"
#include "wayland/ShmBuffer.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct wl_display;
struct wl_registry;
struct wl_compositor;
struct wl_shm;
struct wl_seat;
struct wl_keyboard;
struct wl_output;
struct wl_surface;
struct wl_callback;
struct zwlr_layer_shell_v1;
struct zwlr_layer_surface_v1;
struct zwp_keyboard_shortcuts_inhibit_manager_v1;
struct zwp_keyboard_shortcuts_inhibitor_v1;
struct xkb_context;
struct xkb_keymap;
struct xkb_state;

namespace whichkey::wayland {

/**
 * Compositor backend on top of libwayland-client and wlr-layer-shell.
 *
 * The overlay is a layer surface on the overlay layer. Keyboard grab means
 * exclusive keyboard interactivity, optionally with compositor shortcuts
 * inhibited. Keys are translated with xkbcommon using the keymap the
 * compositor sends.
 */
class WaylandCompositor : public Compositor {
public:
    // Connects and binds the required globals. Throws util::ProtocolError if
    // the display is unreachable or a required global is missing.
    WaylandCompositor(const config::Config& cfg, ui::PangoPainter& painter);
    ~WaylandCompositor() override;

    WaylandCompositor(const WaylandCompositor&) = delete;
    WaylandCompositor& operator=(const WaylandCompositor&) = delete;

    int fd() const override;
    void dispatch_pending(events::EventQueue& out) override;
    bool prepare_read(events::EventQueue& out) override;
    void read_events(events::EventQueue& out) override;
    void cancel_read() override;

    void create_surface(int width, int height) override;
    void resize_surface(int width, int height) override;
    void present(const ui::Layout& layout, int width, int height) override;
    void destroy_surface() override;

    void acquire_keyboard_grab() override;
    void release_keyboard_grab() override;

    void flush() override;

private:
    struct Listeners;

    struct OutputInfo {
        WaylandCompositor* owner = nullptr;
        wl_output* output = nullptr;
        uint32_t name = 0;
        int32_t scale = 1;
    };

    struct SeatInfo {
        WaylandCompositor* owner = nullptr;
        wl_seat* seat = nullptr;
        uint32_t name = 0;
        wl_keyboard* keyboard = nullptr;
        zwp_keyboard_shortcuts_inhibitor_v1* inhibitor = nullptr;
    };

    void connect();
    void teardown();
    void emit(const events::Event& event);
    void handle_key(uint32_t keycode, bool pressed);
    void update_scale();
    void destroy_inhibitors();
    ShmBuffer* next_buffer(int width, int height);
    std::string connection_error(const char* what) const;

    const config::Config& config_;
    ui::PangoPainter& painter_;

    wl_display* display_ = nullptr;
    wl_registry* registry_ = nullptr;
    wl_compositor* compositor_ = nullptr;
    wl_shm* shm_ = nullptr;
    zwlr_layer_shell_v1* layer_shell_ = nullptr;
    zwp_keyboard_shortcuts_inhibit_manager_v1* inhibit_manager_ = nullptr;
    std::vector<std::unique_ptr<OutputInfo>> outputs_;
    std::vector<std::unique_ptr<SeatInfo>> seats_;

    wl_surface* surface_ = nullptr;
    zwlr_layer_surface_v1* layer_surface_ = nullptr;
    wl_callback* frame_callback_ = nullptr;
    std::vector<OutputInfo*> entered_outputs_;
    std::vector<std::unique_ptr<ShmBuffer>> buffers_;
    int32_t scale_ = 1;
    bool configured_ = false;
    bool grabbed_ = false;

    xkb_context* xkb_context_ = nullptr;
    xkb_keymap* xkb_keymap_ = nullptr;
    xkb_state* xkb_state_ = nullptr;

    // Produced by listeners, handed out on the next dispatch
    std::vector<events::Event> pending_;
};

}  // namespace whichkey::wayland
