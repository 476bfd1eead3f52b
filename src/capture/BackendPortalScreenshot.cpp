#include "capture/BackendPortalScreenshot.hpp"

#include <dbus/dbus.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

#include "capture/ImageCodec.hpp"
#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"

namespace roiwatch {

namespace {

constexpr const char* kPortalService = "org.freedesktop.portal.Desktop";
constexpr const char* kPortalPath = "/org/freedesktop/portal/desktop";
constexpr const char* kScreenshotIface = "org.freedesktop.portal.Screenshot";
constexpr const char* kRequestIface = "org.freedesktop.portal.Request";

struct ConnectionUnref {
    void operator()(DBusConnection* c) const {
        dbus_connection_unref(c);
    }
};
struct MessageUnref {
    void operator()(DBusMessage* m) const {
        dbus_message_unref(m);
    }
};
using ConnectionPtr = std::unique_ptr<DBusConnection, ConnectionUnref>;
using MessagePtr = std::unique_ptr<DBusMessage, MessageUnref>;

// DBusError that frees itself and formats as a string.
class BusError {
public:
    BusError() {
        dbus_error_init(&err_);
    }
    BusError(const BusError&) = delete;
    BusError& operator=(const BusError&) = delete;
    ~BusError() {
        dbus_error_free(&err_);
    }

    DBusError* get() {
        return &err_;
    }
    bool isSet() const {
        return dbus_error_is_set(&err_);
    }
    std::string text(const char* context) const {
        return std::string(context) + ": " +
               (err_.message ? err_.message : "unknown");
    }

private:
    DBusError err_;
};

ConnectionPtr openSessionBus(BusError& err) {
    // dbus_bus_get returns a shared connection with a reference for us.
    return ConnectionPtr(dbus_bus_get(DBUS_BUS_SESSION, err.get()));
}

template <typename T>
void putOption(DBusMessageIter* options, const char* key, int type,
               const char* signature, T value) {
    DBusMessageIter entry;
    DBusMessageIter boxed;
    dbus_message_iter_open_container(options, DBUS_TYPE_DICT_ENTRY, nullptr,
                                     &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, signature,
                                     &boxed);
    dbus_message_iter_append_basic(&boxed, type, &value);
    dbus_message_iter_close_container(&entry, &boxed);
    dbus_message_iter_close_container(options, &entry);
}

std::string nextHandleToken() {
    static std::atomic<unsigned> serial{0};
    return "roiwatch_" + std::to_string(getpid()) + "_" +
           std::to_string(serial++);
}

// Screenshot(parent_window, {interactive: false, handle_token}).
MessagePtr buildScreenshotCall(const std::string& token) {
    MessagePtr call(dbus_message_new_method_call(kPortalService, kPortalPath,
                                                 kScreenshotIface,
                                                 "Screenshot"));
    if (!call) {
        return call;
    }
    DBusMessageIter args;
    DBusMessageIter options;
    dbus_message_iter_init_append(call.get(), &args);
    const char* parentWindow = "";
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &parentWindow);
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &options);
    putOption<dbus_bool_t>(&options, "interactive", DBUS_TYPE_BOOLEAN, "b",
                           FALSE);
    putOption<const char*>(&options, "handle_token", DBUS_TYPE_STRING, "s",
                           token.c_str());
    dbus_message_iter_close_container(&args, &options);
    return call;
}

// Response(u response, a{sv} results). Only response 0 carries a uri.
bool readResponseUri(DBusMessage* signal, std::string& uri,
                     std::string& error) {
    DBusMessageIter it;
    if (!dbus_message_iter_init(signal, &it) ||
        dbus_message_iter_get_arg_type(&it) != DBUS_TYPE_UINT32) {
        error = "malformed portal response";
        return false;
    }
    uint32_t code = 0;
    dbus_message_iter_get_basic(&it, &code);
    if (code != 0) {
        error = code == 1 ? "screenshot cancelled by user"
                          : "portal reported screenshot failure";
        return false;
    }
    if (!dbus_message_iter_next(&it) ||
        dbus_message_iter_get_arg_type(&it) != DBUS_TYPE_ARRAY) {
        error = "portal response has no results";
        return false;
    }
    DBusMessageIter results;
    dbus_message_iter_recurse(&it, &results);
    for (; dbus_message_iter_get_arg_type(&results) == DBUS_TYPE_DICT_ENTRY;
         dbus_message_iter_next(&results)) {
        DBusMessageIter kv;
        dbus_message_iter_recurse(&results, &kv);
        const char* key = nullptr;
        dbus_message_iter_get_basic(&kv, &key);
        if (!key || std::strcmp(key, "uri") != 0 ||
            !dbus_message_iter_next(&kv) ||
            dbus_message_iter_get_arg_type(&kv) != DBUS_TYPE_VARIANT) {
            continue;
        }
        DBusMessageIter value;
        dbus_message_iter_recurse(&kv, &value);
        if (dbus_message_iter_get_arg_type(&value) != DBUS_TYPE_STRING) {
            continue;
        }
        const char* text = nullptr;
        dbus_message_iter_get_basic(&value, &text);
        if (text) {
            uri = text;
            return true;
        }
    }
    error = "portal response has no uri";
    return false;
}

}  // namespace

class PortalScreenshotBackend final : public ICaptureBackend {
public:
    std::string name() const override {
        return "portal-screenshot";
    }

    bool isAvailable() const override {
        BusError err;
        ConnectionPtr bus = openSessionBus(err);
        if (!bus) {
            return false;
        }
        const bool owned =
            dbus_bus_name_has_owner(bus.get(), kPortalService, err.get());
        return owned && !err.isSet();
    }

    std::vector<MonitorInfo> listMonitors() override {
        LOG_DEBUG("portal: Screenshot interface does not expose monitors");
        return {};
    }

    // The portal always hands back the whole desktop, so `region` is left
    // to the chain to crop.
    CaptureResult captureOnce(const std::optional<Region>&,
                              std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        CaptureResult result;

        std::string uri;
        if (!requestScreenshot(deadline, uri, result.error)) {
            LOG_WARN("portal: %s", result.error.c_str());
            return result;
        }

        const std::string path = fileUrlToPath(uri);
        std::string decodeErr;
        const bool decoded = decodeImageFile(path, result.image, &decodeErr);
        if (std::remove(path.c_str()) != 0) {
            LOG_DEBUG("portal: could not remove %s", path.c_str());
        }
        if (!decoded) {
            result.image = ImageRGBA{};
            result.error = decodeErr;
            LOG_WARN("portal: %s", decodeErr.c_str());
            return result;
        }
        result.displayBounds = Region{0, 0, result.image.w, result.image.h};
        result.area = result.displayBounds;
        return result;
    }

private:
    static bool requestScreenshot(
        std::chrono::steady_clock::time_point deadline, std::string& uri,
        std::string& error) {
        BusError err;
        ConnectionPtr bus = openSessionBus(err);
        if (!bus) {
            error = err.text("cannot reach session bus");
            return false;
        }

        const std::string token = nextHandleToken();
        MessagePtr call = buildScreenshotCall(token);
        if (!call) {
            error = "out of memory building Screenshot call";
            return false;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        MessagePtr reply(dbus_connection_send_with_reply_and_block(
            bus.get(), call.get(),
            static_cast<int>(std::max<long long>(1, left.count())),
            err.get()));
        if (!reply) {
            error = err.text("Screenshot call failed");
            return false;
        }
        const char* requestPath = nullptr;
        if (!dbus_message_get_args(reply.get(), err.get(),
                                   DBUS_TYPE_OBJECT_PATH, &requestPath,
                                   DBUS_TYPE_INVALID) ||
            !requestPath) {
            error = err.text("unexpected Screenshot reply");
            return false;
        }

        const std::string rule = std::string("type='signal',interface='") +
                                 kRequestIface +
                                 "',member='Response',path='" + requestPath +
                                 "'";
        dbus_bus_add_match(bus.get(), rule.c_str(), err.get());
        if (err.isSet()) {
            error = err.text("cannot subscribe to portal response");
            return false;
        }
        dbus_connection_flush(bus.get());

        while (std::chrono::steady_clock::now() < deadline) {
            dbus_connection_read_write(bus.get(), 50);
            for (MessagePtr msg(dbus_connection_pop_message(bus.get())); msg;
                 msg.reset(dbus_connection_pop_message(bus.get()))) {
                if (dbus_message_is_signal(msg.get(), kRequestIface,
                                           "Response")) {
                    return readResponseUri(msg.get(), uri, error);
                }
            }
        }
        error = "timed out waiting for portal response";
        return false;
    }
};

std::unique_ptr<ICaptureBackend> CreateBackendPortalScreenshot() {
    return std::make_unique<PortalScreenshotBackend>();
}

}  // namespace roiwatch
