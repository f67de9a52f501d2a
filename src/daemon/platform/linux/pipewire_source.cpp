#include "platform/linux/pipewire_source.hpp"

#include <algorithm>
#include <cstring>
#include <nlohmann/json.hpp>
#include <pipewire/extensions/metadata.h>
#include <print>
#include <spa/utils/result.h>

namespace {

// State for one registry roundtrip.
struct Enumeration {
    pw_main_loop* loop = nullptr;
    pw_registry* registry = nullptr;
    pw_metadata* metadata = nullptr;
    spa_hook registry_listener{};
    spa_hook core_listener{};
    spa_hook metadata_listener{};
    int pending = 0;
    std::vector<InputDevice> devices;
    std::string default_name;
};

int on_metadata_property(void* data, uint32_t /*subject*/, const char* key,
                         const char* /*type*/, const char* value) {
    auto* e = static_cast<Enumeration*>(data);
    if (!key || !value || std::strcmp(key, "default.audio.source") != 0) return 0;

    // Value is a JSON object: {"name": "<node.name>"}
    auto j = nlohmann::json::parse(value, nullptr, false);
    if (j.is_object() && j.contains("name") && j["name"].is_string()) {
        e->default_name = j["name"].get<std::string>();
    }
    return 0;
}

const pw_metadata_events metadata_events = {
    .version = PW_VERSION_METADATA_EVENTS,
    .property = on_metadata_property,
};

void on_registry_global(void* data, uint32_t id, uint32_t /*permissions*/, const char* type,
                        uint32_t /*version*/, const spa_dict* props) {
    auto* e = static_cast<Enumeration*>(data);
    if (!props) return;

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) == 0) {
        const char* cls = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
        const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
        if (!cls || !name || std::strcmp(cls, "Audio/Source") != 0) return;

        const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);
        e->devices.push_back({.id = name, .description = desc ? desc : name, .is_default = false});
    } else if (std::strcmp(type, PW_TYPE_INTERFACE_Metadata) == 0 && !e->metadata) {
        const char* mname = spa_dict_lookup(props, PW_KEY_METADATA_NAME);
        if (!mname || std::strcmp(mname, "default") != 0) return;

        e->metadata = static_cast<pw_metadata*>(
            pw_registry_bind(e->registry, id, type, PW_VERSION_METADATA, 0));
        if (e->metadata) {
            pw_metadata_add_listener(e->metadata, &e->metadata_listener, &metadata_events, e);
        }
    }
}

const pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
};

void on_core_done(void* data, uint32_t id, int seq) {
    auto* e = static_cast<Enumeration*>(data);
    if (id == PW_ID_CORE && seq == e->pending) pw_main_loop_quit(e->loop);
}

const pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
};

} // namespace

PipeWireSource::PipeWireSource(SampleRing& ring, uint32_t sample_rate, uint16_t channels)
    : ring_(ring), sample_rate_(sample_rate), channels_(channels) {
    pw_init(nullptr, nullptr);
}

PipeWireSource::~PipeWireSource() {
    close();
    pw_deinit();
}

std::vector<InputDevice> PipeWireSource::list_devices() {
    Enumeration e;
    e.loop = pw_main_loop_new(nullptr);
    if (!e.loop) {
        std::println(stderr, "audio: failed to create main loop");
        return {};
    }

    auto* context = pw_context_new(pw_main_loop_get_loop(e.loop), nullptr, 0);
    auto* core = context ? pw_context_connect(context, nullptr, 0) : nullptr;
    if (!core) {
        std::println(stderr, "audio: cannot connect to PipeWire");
        if (context) pw_context_destroy(context);
        pw_main_loop_destroy(e.loop);
        return {};
    }

    e.registry = pw_core_get_registry(core, PW_VERSION_REGISTRY, 0);
    pw_registry_add_listener(e.registry, &e.registry_listener, &registry_events, &e);
    pw_core_add_listener(core, &e.core_listener, &core_events, &e);

    // First roundtrip collects globals, the second the metadata properties.
    for (int round = 0; round < 2; ++round) {
        e.pending = pw_core_sync(core, PW_ID_CORE, e.pending);
        pw_main_loop_run(e.loop);
    }

    if (e.metadata) {
        spa_hook_remove(&e.metadata_listener);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(e.metadata));
    }
    spa_hook_remove(&e.registry_listener);
    spa_hook_remove(&e.core_listener);
    pw_proxy_destroy(reinterpret_cast<pw_proxy*>(e.registry));
    pw_core_disconnect(core);
    pw_context_destroy(context);
    pw_main_loop_destroy(e.loop);

    for (auto& d : e.devices) d.is_default = (d.id == e.default_name);
    return std::move(e.devices);
}

std::expected<std::string, std::string> PipeWireSource::open(const std::string& device_id) {
    if (capturing_.load(std::memory_order_relaxed)) {
        return std::unexpected(std::string("already capturing"));
    }

    std::string opened = device_id;
    auto devices = list_devices();
    if (device_id.empty()) {
        auto it = std::find_if(devices.begin(), devices.end(),
                               [](const InputDevice& d) { return d.is_default; });
        if (it == devices.end() && devices.empty()) {
            return std::unexpected(std::string("no audio input device"));
        }
        opened = it != devices.end() ? it->id : "default";
    } else if (std::none_of(devices.begin(), devices.end(),
                            [&](const InputDevice& d) { return d.id == device_id; })) {
        return std::unexpected("input device not found: " + device_id);
    }

    loop_ = pw_thread_loop_new("mindscribe", nullptr);
    if (!loop_) {
        return std::unexpected(std::string("failed to create thread loop"));
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "mindscribe",
        PW_KEY_APP_NAME, "mindscribe",
        nullptr
    );
    if (!device_id.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device_id.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "mindscribe-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(std::string("failed to create stream"));
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = channels_
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret >= 0) ret = pw_thread_loop_start(loop_);

    if (ret < 0) {
        std::string err = std::string("stream start failed: ") + spa_strerror(ret);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return std::unexpected(err);
    }

    capturing_.store(true, std::memory_order_release);
    return opened;
}

void PipeWireSource::close() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);

    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireSource::on_process(void* userdata) {
    auto* self = static_cast<PipeWireSource*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* data = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
    size_t size = d->chunk->size;

    if (self->capturing_.load(std::memory_order_relaxed)) {
        self->ring_.push_bytes(data, size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireSource::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                      enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
