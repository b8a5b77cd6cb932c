#include "wayland/WaylandCompositor.hpp"
#include "keyboard-shortcuts-inhibit-unstable-v1-client-protocol.h"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include "wlr-layer-shell-unstable-v1-client-protocol.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <sys/mman.h>
#include <unistd.h>
#include <wayland-client.h>
#include <xkbcommon/xkbcommon.h>

namespace whichkey::wayland {

namespace {

constexpr const char* LAYER_NAMESPACE = "whichkey";

// zwlr_layer_surface_v1 keyboard_interactivity values, stable since v1
constexpr uint32_t KEYBOARD_INTERACTIVITY_NONE = 0;
constexpr uint32_t KEYBOARD_INTERACTIVITY_EXCLUSIVE = 1;

uint32_t anchor_edges(config::Anchor anchor) {
    constexpr uint32_t top = ZWLR_LAYER_SURFACE_V1_ANCHOR_TOP;
    constexpr uint32_t bottom = ZWLR_LAYER_SURFACE_V1_ANCHOR_BOTTOM;
    constexpr uint32_t left = ZWLR_LAYER_SURFACE_V1_ANCHOR_LEFT;
    constexpr uint32_t right = ZWLR_LAYER_SURFACE_V1_ANCHOR_RIGHT;

    switch (anchor) {
        case config::Anchor::Center:      return 0;
        case config::Anchor::Top:         return top;
        case config::Anchor::Bottom:      return bottom;
        case config::Anchor::Left:        return left;
        case config::Anchor::Right:       return right;
        case config::Anchor::TopLeft:     return top | left;
        case config::Anchor::TopRight:    return top | right;
        case config::Anchor::BottomLeft:  return bottom | left;
        case config::Anchor::BottomRight: return bottom | right;
    }
    return 0;
}

}  // namespace

// Static trampolines for the C listener tables. Nested so they can reach
// the private state.
struct WaylandCompositor::Listeners {
    // ========== REGISTRY ==========

    static void registry_global(void* data, wl_registry* registry, uint32_t name, const char* interface,
                                uint32_t version) {
        auto* self = static_cast<WaylandCompositor*>(data);

        if (std::strcmp(interface, wl_compositor_interface.name) == 0) {
            self->compositor_ = static_cast<wl_compositor*>(
                wl_registry_bind(registry, name, &wl_compositor_interface, std::min<uint32_t>(version, 4)));
        } else if (std::strcmp(interface, wl_shm_interface.name) == 0) {
            self->shm_ = static_cast<wl_shm*>(wl_registry_bind(registry, name, &wl_shm_interface, 1));
        } else if (std::strcmp(interface, zwlr_layer_shell_v1_interface.name) == 0) {
            self->layer_shell_ = static_cast<zwlr_layer_shell_v1*>(
                wl_registry_bind(registry, name, &zwlr_layer_shell_v1_interface, 1));
        } else if (std::strcmp(interface, zwp_keyboard_shortcuts_inhibit_manager_v1_interface.name) == 0) {
            self->inhibit_manager_ = static_cast<zwp_keyboard_shortcuts_inhibit_manager_v1*>(
                wl_registry_bind(registry, name, &zwp_keyboard_shortcuts_inhibit_manager_v1_interface, 1));
        } else if (std::strcmp(interface, wl_output_interface.name) == 0) {
            auto info = std::make_unique<OutputInfo>();
            info->owner = self;
            info->name = name;
            info->output = static_cast<wl_output*>(
                wl_registry_bind(registry, name, &wl_output_interface, std::min<uint32_t>(version, 2)));
            wl_output_add_listener(info->output, &OUTPUT, info.get());
            self->outputs_.push_back(std::move(info));
        } else if (std::strcmp(interface, wl_seat_interface.name) == 0) {
            auto info = std::make_unique<SeatInfo>();
            info->owner = self;
            info->name = name;
            info->seat = static_cast<wl_seat*>(
                wl_registry_bind(registry, name, &wl_seat_interface, std::min<uint32_t>(version, 5)));
            wl_seat_add_listener(info->seat, &SEAT, info.get());
            self->seats_.push_back(std::move(info));
        }
    }

    static void registry_global_remove(void* data, wl_registry*, uint32_t name) {
        auto* self = static_cast<WaylandCompositor*>(data);

        auto out = std::find_if(self->outputs_.begin(), self->outputs_.end(),
                                [name](const auto& o) { return o->name == name; });
        if (out != self->outputs_.end()) {
            OutputInfo* info = out->get();
            std::erase(self->entered_outputs_, info);
            wl_output_destroy(info->output);
            self->outputs_.erase(out);
            self->update_scale();
            return;
        }

        auto seat = std::find_if(self->seats_.begin(), self->seats_.end(),
                                 [name](const auto& s) { return s->name == name; });
        if (seat != self->seats_.end()) {
            SeatInfo* info = seat->get();
            util::Logger::warn(std::format("Wayland: Seat {} removed", name));
            if (info->inhibitor) zwp_keyboard_shortcuts_inhibitor_v1_destroy(info->inhibitor);
            if (info->keyboard) wl_keyboard_destroy(info->keyboard);
            wl_seat_destroy(info->seat);
            self->seats_.erase(seat);
        }
    }

    // ========== OUTPUT ==========

    static void output_geometry(void*, wl_output*, int32_t, int32_t, int32_t, int32_t, int32_t, const char*,
                                const char*, int32_t) {}
    static void output_mode(void*, wl_output*, uint32_t, int32_t, int32_t, int32_t) {}
    static void output_done(void*, wl_output*) {}

    static void output_scale(void* data, wl_output*, int32_t factor) {
        auto* info = static_cast<OutputInfo*>(data);
        info->scale = factor > 0 ? factor : 1;
        info->owner->update_scale();
    }

    // ========== SEAT / KEYBOARD ==========

    static void seat_capabilities(void* data, wl_seat* seat, uint32_t caps) {
        auto* info = static_cast<SeatInfo*>(data);
        bool has_keyboard = caps & WL_SEAT_CAPABILITY_KEYBOARD;

        if (has_keyboard && !info->keyboard) {
            info->keyboard = wl_seat_get_keyboard(seat);
            wl_keyboard_add_listener(info->keyboard, &KEYBOARD, info);
        } else if (!has_keyboard && info->keyboard) {
            util::Logger::warn("Wayland: Seat lost its keyboard");
            if (wl_keyboard_get_version(info->keyboard) >= WL_KEYBOARD_RELEASE_SINCE_VERSION) {
                wl_keyboard_release(info->keyboard);
            } else {
                wl_keyboard_destroy(info->keyboard);
            }
            info->keyboard = nullptr;
        }
    }

    static void seat_name(void*, wl_seat*, const char* name) {
        util::Logger::debug(std::format("Wayland: Seat '{}'", name));
    }

    static void keyboard_keymap(void* data, wl_keyboard*, uint32_t format, int32_t fd, uint32_t size) {
        auto* self = static_cast<SeatInfo*>(data)->owner;

        if (format != WL_KEYBOARD_KEYMAP_FORMAT_XKB_V1) {
            util::Logger::warn(std::format("Wayland: Ignoring keymap in format {}", format));
            close(fd);
            return;
        }

        void* map = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (map == MAP_FAILED) {
            util::Logger::error(std::format("Wayland: Failed to mmap keymap: errno={}", errno));
            close(fd);
            return;
        }

        const char* text = static_cast<const char*>(map);
        xkb_keymap* keymap = xkb_keymap_new_from_buffer(self->xkb_context_, text, strnlen(text, size),
                                                        XKB_KEYMAP_FORMAT_TEXT_V1,
                                                        XKB_KEYMAP_COMPILE_NO_FLAGS);
        munmap(map, size);
        close(fd);

        if (!keymap) {
            util::Logger::error("Wayland: Failed to compile keymap");
            return;
        }
        xkb_state* state = xkb_state_new(keymap);
        if (!state) {
            util::Logger::error("Wayland: Failed to create xkb state");
            xkb_keymap_unref(keymap);
            return;
        }

        xkb_state_unref(self->xkb_state_);
        xkb_keymap_unref(self->xkb_keymap_);
        self->xkb_keymap_ = keymap;
        self->xkb_state_ = state;
        util::Logger::debug("Wayland: Keymap loaded");
    }

    static void keyboard_enter(void* data, wl_keyboard*, uint32_t, wl_surface*, wl_array*) {
        static_cast<SeatInfo*>(data)->owner->emit(events::Event{events::Event::Type::KeyboardEnter});
    }

    static void keyboard_leave(void* data, wl_keyboard*, uint32_t, wl_surface*) {
        static_cast<SeatInfo*>(data)->owner->emit(events::Event{events::Event::Type::KeyboardLeave});
    }

    static void keyboard_key(void* data, wl_keyboard*, uint32_t, uint32_t, uint32_t key, uint32_t state) {
        // evdev scancode to xkb keycode
        static_cast<SeatInfo*>(data)->owner->handle_key(key + 8, state == WL_KEYBOARD_KEY_STATE_PRESSED);
    }

    static void keyboard_modifiers(void* data, wl_keyboard*, uint32_t, uint32_t depressed, uint32_t latched,
                                   uint32_t locked, uint32_t group) {
        auto* self = static_cast<SeatInfo*>(data)->owner;
        if (self->xkb_state_) {
            xkb_state_update_mask(self->xkb_state_, depressed, latched, locked, 0, 0, group);
        }
    }

    static void keyboard_repeat_info(void* data, wl_keyboard*, int32_t rate, int32_t delay) {
        events::Event event{events::Event::Type::RepeatInfo};
        event.repeat_rate = rate;
        event.repeat_delay = delay;
        static_cast<SeatInfo*>(data)->owner->emit(event);
    }

    // ========== SURFACE ==========

    static void surface_enter(void* data, wl_surface*, wl_output* output) {
        auto* self = static_cast<WaylandCompositor*>(data);
        for (auto& info : self->outputs_) {
            if (info->output == output) {
                self->entered_outputs_.push_back(info.get());
            }
        }
        self->update_scale();
    }

    static void surface_leave(void* data, wl_surface*, wl_output* output) {
        auto* self = static_cast<WaylandCompositor*>(data);
        std::erase_if(self->entered_outputs_, [output](OutputInfo* o) { return o->output == output; });
        self->update_scale();
    }

    static void layer_surface_configure(void* data, zwlr_layer_surface_v1* layer_surface, uint32_t serial,
                                        uint32_t width, uint32_t height) {
        auto* self = static_cast<WaylandCompositor*>(data);
        zwlr_layer_surface_v1_ack_configure(layer_surface, serial);
        self->configured_ = true;

        events::Event event{events::Event::Type::Configure};
        event.width = width;
        event.height = height;
        self->emit(event);
    }

    static void layer_surface_closed(void* data, zwlr_layer_surface_v1*) {
        static_cast<WaylandCompositor*>(data)->emit(events::Event{events::Event::Type::SurfaceClosed});
    }

    static void frame_done(void* data, wl_callback* callback, uint32_t) {
        auto* self = static_cast<WaylandCompositor*>(data);
        wl_callback_destroy(callback);
        self->frame_callback_ = nullptr;
        self->emit(events::Event{events::Event::Type::FrameDone});
    }

    static constexpr wl_registry_listener REGISTRY = {
        .global = registry_global,
        .global_remove = registry_global_remove,
    };

    // wl_output is bound at most at v2, later events never arrive
    static constexpr wl_output_listener OUTPUT = {
        .geometry = output_geometry,
        .mode = output_mode,
        .done = output_done,
        .scale = output_scale,
    };

    static constexpr wl_seat_listener SEAT = {
        .capabilities = seat_capabilities,
        .name = seat_name,
    };

    static constexpr wl_keyboard_listener KEYBOARD = {
        .keymap = keyboard_keymap,
        .enter = keyboard_enter,
        .leave = keyboard_leave,
        .key = keyboard_key,
        .modifiers = keyboard_modifiers,
        .repeat_info = keyboard_repeat_info,
    };

    // wl_surface is created from a v4 compositor at most
    static constexpr wl_surface_listener SURFACE = {
        .enter = surface_enter,
        .leave = surface_leave,
    };

    static constexpr zwlr_layer_surface_v1_listener LAYER_SURFACE = {
        .configure = layer_surface_configure,
        .closed = layer_surface_closed,
    };

    static constexpr wl_callback_listener FRAME = {
        .done = frame_done,
    };
};

WaylandCompositor::WaylandCompositor(const config::Config& cfg, ui::PangoPainter& painter)
    : config_(cfg), painter_(painter) {
    try {
        connect();
    } catch (...) {
        teardown();
        throw;
    }
}

WaylandCompositor::~WaylandCompositor() {
    teardown();
}

void WaylandCompositor::connect() {
    xkb_context_ = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!xkb_context_) {
        throw util::ProtocolError("failed to create xkb context");
    }

    display_ = wl_display_connect(nullptr);
    if (!display_) {
        throw util::ProtocolError("failed to connect to the Wayland display");
    }

    registry_ = wl_display_get_registry(display_);
    wl_registry_add_listener(registry_, &Listeners::REGISTRY, this);
    if (wl_display_roundtrip(display_) < 0) {
        throw util::ProtocolError(connection_error("registry roundtrip"));
    }

    if (!compositor_) {
        throw util::ProtocolError("compositor does not advertise wl_compositor");
    }
    if (!shm_) {
        throw util::ProtocolError("compositor does not advertise wl_shm");
    }
    if (!layer_shell_) {
        throw util::ProtocolError("compositor does not support wlr-layer-shell (zwlr_layer_shell_v1)");
    }

    // Second roundtrip collects seat capabilities, output scales and the keymap
    if (wl_display_roundtrip(display_) < 0) {
        throw util::ProtocolError(connection_error("initial roundtrip"));
    }

    util::Logger::info(std::format("Wayland: Connected ({} outputs, {} seats, shortcuts inhibitor {})",
                                   outputs_.size(), seats_.size(),
                                   inhibit_manager_ ? "available" : "unavailable"));
}

void WaylandCompositor::teardown() {
    destroy_surface();
    destroy_inhibitors();

    for (auto& seat : seats_) {
        if (seat->keyboard) wl_keyboard_destroy(seat->keyboard);
        wl_seat_destroy(seat->seat);
    }
    seats_.clear();
    for (auto& output : outputs_) {
        wl_output_destroy(output->output);
    }
    outputs_.clear();

    if (inhibit_manager_) zwp_keyboard_shortcuts_inhibit_manager_v1_destroy(inhibit_manager_);
    if (layer_shell_) zwlr_layer_shell_v1_destroy(layer_shell_);
    if (shm_) wl_shm_destroy(shm_);
    if (compositor_) wl_compositor_destroy(compositor_);
    if (registry_) wl_registry_destroy(registry_);
    inhibit_manager_ = nullptr;
    layer_shell_ = nullptr;
    shm_ = nullptr;
    compositor_ = nullptr;
    registry_ = nullptr;

    xkb_state_unref(xkb_state_);
    xkb_keymap_unref(xkb_keymap_);
    xkb_context_unref(xkb_context_);
    xkb_state_ = nullptr;
    xkb_keymap_ = nullptr;
    xkb_context_ = nullptr;

    if (display_) {
        wl_display_disconnect(display_);
        display_ = nullptr;
    }
}

std::string WaylandCompositor::connection_error(const char* what) const {
    int err = wl_display_get_error(display_);
    if (err == EPROTO) {
        const wl_interface* interface = nullptr;
        uint32_t id = 0;
        uint32_t code = wl_display_get_protocol_error(display_, &interface, &id);
        return std::format("{}: protocol error {} on {}#{}", what, code, interface ? interface->name : "?", id);
    }
    return std::format("{}: {}", what, err ? std::strerror(err) : "connection closed");
}

void WaylandCompositor::emit(const events::Event& event) {
    pending_.push_back(event);
}

void WaylandCompositor::handle_key(uint32_t keycode, bool pressed) {
    if (!xkb_state_) {
        util::Logger::warn("Wayland: Key event before keymap, ignored");
        return;
    }

    xkb_keysym_t sym = xkb_state_key_get_one_sym(xkb_state_, keycode);

    // Bindings are written against the first layout; resolve other layouts'
    // keys to what the same key would produce there
    if (config_.auto_kbd_layout && xkb_state_key_get_layout(xkb_state_, keycode) != 0) {
        xkb_level_index_t level = xkb_state_key_get_level(xkb_state_, keycode, 0);
        const xkb_keysym_t* syms = nullptr;
        if (xkb_keymap_key_get_syms_by_level(xkb_keymap_, keycode, 0, level, &syms) == 1) {
            sym = syms[0];
        }
    }

    events::Event event{events::Event::Type::Key};
    event.key.keysym = sym;
    event.key.keycode = keycode;
    event.key.pressed = pressed;
    event.key.modifiers.ctrl =
        xkb_state_mod_name_is_active(xkb_state_, XKB_MOD_NAME_CTRL, XKB_STATE_MODS_EFFECTIVE) > 0;
    event.key.modifiers.alt =
        xkb_state_mod_name_is_active(xkb_state_, XKB_MOD_NAME_ALT, XKB_STATE_MODS_EFFECTIVE) > 0;
    event.key.modifiers.logo =
        xkb_state_mod_name_is_active(xkb_state_, XKB_MOD_NAME_LOGO, XKB_STATE_MODS_EFFECTIVE) > 0;
    emit(event);
}

void WaylandCompositor::update_scale() {
    if (entered_outputs_.empty()) return;

    int32_t scale = 1;
    for (const auto* output : entered_outputs_) {
        scale = std::max(scale, output->scale);
    }
    if (scale != scale_) {
        util::Logger::info(std::format("Wayland: Buffer scale {} -> {}", scale_, scale));
        scale_ = scale;
        events::Event event{events::Event::Type::ScaleChanged};
        event.scale = scale;
        emit(event);
    }
}

// ========== EVENT SOURCE ==========

int WaylandCompositor::fd() const {
    return wl_display_get_fd(display_);
}

void WaylandCompositor::dispatch_pending(events::EventQueue& out) {
    if (wl_display_dispatch_pending(display_) < 0) {
        throw util::ProtocolError(connection_error("dispatch"));
    }
    for (const auto& event : pending_) {
        out.push(event);
    }
    pending_.clear();
}

bool WaylandCompositor::prepare_read(events::EventQueue& out) {
    while (wl_display_prepare_read(display_) != 0) {
        dispatch_pending(out);
    }
    if (!out.empty()) {
        wl_display_cancel_read(display_);
        return false;
    }
    if (wl_display_flush(display_) < 0 && errno != EAGAIN) {
        wl_display_cancel_read(display_);
        throw util::ProtocolError(connection_error("flush"));
    }
    return true;
}

void WaylandCompositor::read_events(events::EventQueue& out) {
    if (wl_display_read_events(display_) < 0) {
        throw util::ProtocolError(connection_error("read"));
    }
    dispatch_pending(out);
}

void WaylandCompositor::cancel_read() {
    wl_display_cancel_read(display_);
}

// ========== SURFACE ==========

void WaylandCompositor::create_surface(int width, int height) {
    surface_ = wl_compositor_create_surface(compositor_);
    wl_surface_add_listener(surface_, &Listeners::SURFACE, this);

    layer_surface_ = zwlr_layer_shell_v1_get_layer_surface(layer_shell_, surface_, nullptr,
                                                           ZWLR_LAYER_SHELL_V1_LAYER_OVERLAY, LAYER_NAMESPACE);
    zwlr_layer_surface_v1_add_listener(layer_surface_, &Listeners::LAYER_SURFACE, this);
    zwlr_layer_surface_v1_set_size(layer_surface_, static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    zwlr_layer_surface_v1_set_anchor(layer_surface_, anchor_edges(config_.anchor));
    zwlr_layer_surface_v1_set_margin(layer_surface_, config_.margin_top, config_.margin_right,
                                     config_.margin_bottom, config_.margin_left);

    // No buffer may be attached before the first configure
    configured_ = false;
    wl_surface_commit(surface_);
    util::Logger::info(std::format("Wayland: Layer surface created ({}x{})", width, height));
}

void WaylandCompositor::resize_surface(int width, int height) {
    if (!layer_surface_) return;
    zwlr_layer_surface_v1_set_size(layer_surface_, static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    wl_surface_commit(surface_);
}

ShmBuffer* WaylandCompositor::next_buffer(int width, int height) {
    for (auto& buffer : buffers_) {
        if (!buffer->busy() && buffer->width() == width && buffer->height() == height) {
            return buffer.get();
        }
    }
    for (auto& buffer : buffers_) {
        if (!buffer->busy()) {
            buffer = std::make_unique<ShmBuffer>(shm_, width, height);
            return buffer.get();
        }
    }
    buffers_.push_back(std::make_unique<ShmBuffer>(shm_, width, height));
    return buffers_.back().get();
}

void WaylandCompositor::present(const ui::Layout& layout, int surface_width, int surface_height) {
    if (!surface_ || !configured_) return;

    int width = surface_width * scale_;
    int height = surface_height * scale_;
    if (width <= 0 || height <= 0) return;

    ShmBuffer* buffer = next_buffer(width, height);
    painter_.paint(buffer->data(), width, height, buffer->stride(), scale_, layout);

    wl_surface_set_buffer_scale(surface_, scale_);
    wl_surface_attach(surface_, buffer->buffer(), 0, 0);
    wl_surface_damage_buffer(surface_, 0, 0, width, height);
    if (!frame_callback_) {
        frame_callback_ = wl_surface_frame(surface_);
        wl_callback_add_listener(frame_callback_, &Listeners::FRAME, this);
    }
    wl_surface_commit(surface_);
    buffer->mark_busy();
}

void WaylandCompositor::destroy_surface() {
    if (frame_callback_) {
        wl_callback_destroy(frame_callback_);
        frame_callback_ = nullptr;
    }
    if (layer_surface_) {
        zwlr_layer_surface_v1_destroy(layer_surface_);
        layer_surface_ = nullptr;
    }
    if (surface_) {
        wl_surface_destroy(surface_);
        surface_ = nullptr;
    }
    buffers_.clear();
    entered_outputs_.clear();
    configured_ = false;
}

// ========== KEYBOARD GRAB ==========

void WaylandCompositor::acquire_keyboard_grab() {
    if (!layer_surface_) {
        throw util::GrabError("no overlay surface to direct keyboard focus to");
    }

    bool has_keyboard = std::any_of(seats_.begin(), seats_.end(), [](const auto& s) { return s->keyboard; });
    if (!has_keyboard) {
        throw util::GrabError("no seat with a keyboard");
    }

    if (config_.inhibit_compositor_keyboard_shortcuts) {
        if (!inhibit_manager_) {
            throw util::GrabError("compositor does not support zwp_keyboard_shortcuts_inhibit_manager_v1");
        }
        for (auto& seat : seats_) {
            if (seat->keyboard && !seat->inhibitor) {
                seat->inhibitor = zwp_keyboard_shortcuts_inhibit_manager_v1_inhibit_shortcuts(
                    inhibit_manager_, surface_, seat->seat);
            }
        }
    }

    zwlr_layer_surface_v1_set_keyboard_interactivity(layer_surface_, KEYBOARD_INTERACTIVITY_EXCLUSIVE);
    wl_surface_commit(surface_);

    // A protocol error from the grab request shows up here; the connection is
    // gone afterwards
    if (wl_display_roundtrip(display_) < 0) {
        destroy_inhibitors();
        throw util::ProtocolError(connection_error("keyboard grab"));
    }
    grabbed_ = true;
    util::Logger::info("Wayland: Exclusive keyboard grab acquired");
}

void WaylandCompositor::destroy_inhibitors() {
    for (auto& seat : seats_) {
        if (seat->inhibitor) {
            zwp_keyboard_shortcuts_inhibitor_v1_destroy(seat->inhibitor);
            seat->inhibitor = nullptr;
        }
    }
}

void WaylandCompositor::release_keyboard_grab() {
    if (!grabbed_) return;
    grabbed_ = false;

    destroy_inhibitors();
    if (layer_surface_) {
        zwlr_layer_surface_v1_set_keyboard_interactivity(layer_surface_, KEYBOARD_INTERACTIVITY_NONE);
        wl_surface_commit(surface_);
    }
    flush();
    util::Logger::info("Wayland: Keyboard grab released");
}

void WaylandCompositor::flush() {
    if (!display_) return;
    if (wl_display_flush(display_) < 0 && errno != EAGAIN) {
        util::Logger::warn(std::format("Wayland: Flush failed: {}", std::strerror(errno)));
    }
}

}  // namespace whichkey::wayland
