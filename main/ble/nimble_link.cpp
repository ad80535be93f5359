#include <main/ble/nimble_link.hpp>
#include <main/config/config.hpp>
#include <main/utils/logger.hpp>
#include <main/utils/watchdog.hpp>

#include <host/util/util.h>
#include <nimble/nimble_port.h>
#include <nimble/nimble_port_freertos.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>

static const char* TAG = "NimbleLink";

namespace {
    static NimbleLink* s_instance = nullptr;
    static volatile bool s_host_synced = false;


    static void* tagFor(uint32_t id) {
        return reinterpret_cast<void*>(static_cast<uintptr_t>(id));
    }

    static void toNimbleUuid(const GattUuid& uuid, ble_uuid_any_t& out) {
        std::memset(&out, 0, sizeof(out));
        if (uuid.is_short) {
            out.u16.u.type = BLE_UUID_TYPE_16;
            out.u16.value = uuid.short_value;
        } else {
            out.u128.u.type = BLE_UUID_TYPE_128;
            std::memcpy(out.u128.value, uuid.value, sizeof(out.u128.value));
        }
    }
}

NimbleLink::NimbleLink()
    : op_done_buffer(),
      op_done(nullptr),
      synced_buffer(),
      synced(nullptr),
      op_id(0),
      op_status(BleStatus::FAILED),
      connected(false),
      conn_handle(0),
      own_addr_type(BLE_OWN_ADDR_PUBLIC),
      found_handle(0),
      read_target(nullptr),
      read_capacity(0),
      read_length(0),
      handle_cache(),
      handle_cache_count(0) {
    op_done = xSemaphoreCreateBinaryStatic(&op_done_buffer);
    synced = xSemaphoreCreateBinaryStatic(&synced_buffer);
    s_instance = this;
}

NimbleLink::~NimbleLink() {
    disconnect();
    s_instance = nullptr;
}

bool NimbleLink::startHost(uint32_t timeout_ms) {
    esp_err_t err = nimble_port_init();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "nimble_port_init failed: %d", static_cast<int>(err));
        return false;
    }
    ble_hs_cfg.sync_cb = &NimbleLink::onSync;
    ble_hs_cfg.reset_cb = &NimbleLink::onReset;
    nimble_port_freertos_init(&NimbleLink::hostTask);

    if (xSemaphoreTake(synced, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
        LOG_ERROR(TAG, "Host did not sync within %lu ms", static_cast<unsigned long>(timeout_ms));
        return false;
    }
    return true;
}

bool NimbleLink::parseAddress(const char* address, ble_addr_t& out) {
    unsigned int b[6];
    char tail = '\0';
    int n = std::sscanf(address, "%2x:%2x:%2x:%2x:%2x:%2x%c", &b[0], &b[1], &b[2], &b[3], &b[4], &b[5], &tail);
    if (n != 6) {
        return false;
    }
    out.type = BLE_ADDR_PUBLIC;
    // ble_addr_t stores the address least significant byte first
    for (int i = 0; i < 6; ++i) {
        out.val[5 - i] = static_cast<uint8_t>(b[i]);
    }
    return true;
}

// ---------------------------------------------------------------------------
// Host task callbacks

void NimbleLink::hostTask(void*) {
    nimble_port_run();
    nimble_port_freertos_deinit();
}

void NimbleLink::onSync() {
    int rc = ble_hs_util_ensure_addr(0);
    if (rc != 0) {
        LOG_ERROR(TAG, "No usable BLE address: %d", rc);
        return;
    }
    if (s_instance == nullptr) {
        return;
    }
    rc = ble_hs_id_infer_auto(0, &s_instance->own_addr_type);
    if (rc != 0) {
        LOG_ERROR(TAG, "ble_hs_id_infer_auto failed: %d", rc);
        return;
    }
    s_host_synced = true;
    xSemaphoreGive(s_instance->synced);
    LOG_INFO(TAG, "%s", "NimBLE host synced");
}

void NimbleLink::onReset(int reason) {
    s_host_synced = false;
    LOG_WARN(TAG, "NimBLE host reset, reason=%d", reason);
}

int NimbleLink::onGapEvent(struct ble_gap_event* event, void* arg) {
    NimbleLink* self = s_instance;
    if (self == nullptr) {
        return 0;
    }
    switch (event->type) {
        case BLE_GAP_EVENT_CONNECT:
            if (event->connect.status == 0 && !self->isCurrent(arg)) {
                // connect() already gave up on this attempt; nobody owns the link
                LOG_WARN(TAG, "Late connect on handle %u, terminating", event->connect.conn_handle);
                int rc = ble_gap_terminate(event->connect.conn_handle, BLE_ERR_REM_USER_CONN_TERM);
                if (rc != 0) {
                    LOG_WARN(TAG, "ble_gap_terminate failed: %d", rc);
                }
            } else if (event->connect.status == 0) {
                self->conn_handle = event->connect.conn_handle;
                self->connected = true;
                self->completeOperation(arg, BleStatus::OK);
            } else {
                LOG_WARN(TAG, "Connect event status=%d", event->connect.status);
                self->completeOperation(arg, BleStatus::FAILED);
            }
            break;
        case BLE_GAP_EVENT_DISCONNECT:
            if (!self->connected || event->disconnect.conn.conn_handle != self->conn_handle) {
                // Stale link terminated above
                break;
            }
            LOG_INFO(TAG, "Link closed, reason=0x%03X", event->disconnect.reason);
            self->connected = false;
            // Whatever is in flight on this link is lost
            self->completeOperation(tagFor(self->op_id), BleStatus::DISCONNECTED);
            break;
        default:
            break;
    }
    return 0;
}

int NimbleLink::onChrDiscovered(uint16_t, const struct ble_gatt_error* error,
                                const struct ble_gatt_chr* chr, void* arg) {
    NimbleLink* self = s_instance;
    if (self == nullptr || !self->isCurrent(arg)) {
        return 0;
    }
    if (error->status == 0) {
        self->found_handle = chr->val_handle;
    } else if (error->status == BLE_HS_EDONE) {
        self->completeOperation(arg, self->found_handle != 0 ? BleStatus::OK : BleStatus::NOT_FOUND);
    } else {
        self->completeOperation(arg, self->mapGattStatus(error->status));
    }
    return 0;
}

int NimbleLink::onWriteDone(uint16_t, const struct ble_gatt_error* error, struct ble_gatt_attr*, void* arg) {
    NimbleLink* self = s_instance;
    if (self == nullptr) {
        return 0;
    }
    self->completeOperation(arg, self->mapGattStatus(error->status));
    return 0;
}

int NimbleLink::onReadDone(uint16_t, const struct ble_gatt_error* error, struct ble_gatt_attr* attr, void* arg) {
    NimbleLink* self = s_instance;
    if (self == nullptr || !self->isCurrent(arg)) {
        return 0;
    }
    if (error->status != 0 || attr == nullptr) {
        self->completeOperation(arg, self->mapGattStatus(error->status));
        return 0;
    }
    const std::size_t length = OS_MBUF_PKTLEN(attr->om);
    const std::size_t copy = std::min(length, self->read_capacity);
    if (os_mbuf_copydata(attr->om, 0, static_cast<int>(copy), self->read_target) != 0) {
        self->completeOperation(arg, BleStatus::FAILED);
        return 0;
    }
    self->read_length = length;
    self->completeOperation(arg, BleStatus::OK);
    return 0;
}

// ---------------------------------------------------------------------------
// Operation handshake between the calling task and the host task

void* NimbleLink::beginOperation() {
    // Drop a completion left over from an operation that already timed out
    (void)xSemaphoreTake(op_done, 0);
    op_status = BleStatus::FAILED;
    op_id = op_id + 1;
    return tagFor(op_id);
}

bool NimbleLink::isCurrent(void* op_tag) const {
    return reinterpret_cast<uintptr_t>(op_tag) == static_cast<uintptr_t>(op_id);
}

void NimbleLink::completeOperation(void* op_tag, BleStatus status) {
    if (!isCurrent(op_tag)) {
        return;
    }
    op_status = status;
    xSemaphoreGive(op_done);
}

BleStatus NimbleLink::awaitOperation(uint32_t timeout_ms) {
    uint32_t remaining = timeout_ms;
    for (;;) {
        Watchdog::feed();
        const uint32_t slice = std::min(remaining, Config::Ble::feed_slice_ms);
        if (xSemaphoreTake(op_done, pdMS_TO_TICKS(slice)) == pdTRUE) {
            Watchdog::feed();
            return op_status;
        }
        remaining -= slice;
        if (remaining == 0) {
            break;
        }
    }
    // Late callbacks for this operation are ignored from now on
    op_id = op_id + 1;
    return connected ? BleStatus::TIMEOUT : BleStatus::DISCONNECTED;
}

BleStatus NimbleLink::mapGattStatus(int status) const {
    if (status == 0) {
        return BleStatus::OK;
    }
    if (status == BLE_HS_ENOTCONN || !connected) {
        return BleStatus::DISCONNECTED;
    }
    if (status == BLE_HS_ETIMEOUT) {
        return BleStatus::TIMEOUT;
    }
    if (status == BLE_HS_ATT_ERR(BLE_ATT_ERR_ATTR_NOT_FOUND)) {
        return BleStatus::NOT_FOUND;
    }
    return BleStatus::FAILED;
}

BleStatus NimbleLink::resolveHandle(const GattUuid& characteristic, uint16_t& out_handle) {
    for (std::size_t i = 0; i < handle_cache_count; ++i) {
        if (handle_cache[i].uuid == characteristic) {
            out_handle = handle_cache[i].value_handle;
            return BleStatus::OK;
        }
    }

    ble_uuid_any_t uuid;
    toNimbleUuid(characteristic, uuid);
    void* tag = beginOperation();
    found_handle = 0;
    int rc = ble_gattc_disc_chrs_by_uuid(conn_handle, 1, 0xFFFF, &uuid.u, &NimbleLink::onChrDiscovered, tag);
    if (rc != 0) {
        return mapGattStatus(rc);
    }
    BleStatus status = awaitOperation(Config::Ble::gatt_timeout_ms);
    if (status != BleStatus::OK) {
        return status;
    }
    out_handle = found_handle;
    if (handle_cache_count < HANDLE_CACHE_SIZE) {
        handle_cache[handle_cache_count++] = HandleEntry{characteristic, found_handle};
    }
    LOG_DEBUG(TAG, "0x%04X -> handle 0x%04X", characteristic.alias(), found_handle);
    return BleStatus::OK;
}

// ---------------------------------------------------------------------------
// BleLink

BleStatus NimbleLink::connect(const char* address) {
    if (!s_host_synced) {
        LOG_ERROR(TAG, "%s", "Host not synced");
        return BleStatus::FAILED;
    }
    if (connected) {
        LOG_ERROR(TAG, "%s", "Already connected");
        return BleStatus::FAILED;
    }
    ble_addr_t peer;
    if (!parseAddress(address, peer)) {
        LOG_ERROR(TAG, "Invalid address '%s'", address);
        return BleStatus::FAILED;
    }
    handle_cache_count = 0;

    void* tag = beginOperation();
    int rc = ble_gap_connect(own_addr_type, &peer, static_cast<int32_t>(Config::Ble::connect_timeout_ms),
                             nullptr, &NimbleLink::onGapEvent, tag);
    if (rc != 0) {
        LOG_ERROR(TAG, "ble_gap_connect failed: %d", rc);
        return BleStatus::FAILED;
    }
    BleStatus status = awaitOperation(Config::Ble::connect_timeout_ms + Config::Ble::connect_grace_ms);
    if (status == BleStatus::OK) {
        return status;
    }
    if (connected) {
        // Link came up after the wait expired; the caller treats this as a failure
        disconnect();
    } else {
        rc = ble_gap_conn_cancel();
        if (rc != 0 && rc != BLE_HS_EALREADY) {
            LOG_DEBUG(TAG, "ble_gap_conn_cancel: %d", rc);
        }
    }
    return status == BleStatus::DISCONNECTED ? BleStatus::TIMEOUT : status;
}

BleStatus NimbleLink::write(const GattUuid& characteristic, const uint8_t* data, std::size_t length,
                            bool with_response) {
    if (!connected) {
        return BleStatus::DISCONNECTED;
    }
    uint16_t handle = 0;
    BleStatus status = resolveHandle(characteristic, handle);
    if (status != BleStatus::OK) {
        return status;
    }
    if (!with_response) {
        return mapGattStatus(ble_gattc_write_no_rsp_flat(conn_handle, handle, data, static_cast<uint16_t>(length)));
    }
    void* tag = beginOperation();
    int rc = ble_gattc_write_flat(conn_handle, handle, data, static_cast<uint16_t>(length),
                                  &NimbleLink::onWriteDone, tag);
    if (rc != 0) {
        return mapGattStatus(rc);
    }
    return awaitOperation(Config::Ble::gatt_timeout_ms);
}

BleStatus NimbleLink::read(const GattUuid& characteristic, uint8_t* out, std::size_t capacity,
                           std::size_t& out_length) {
    out_length = 0;
    if (!connected) {
        return BleStatus::DISCONNECTED;
    }
    uint16_t handle = 0;
    BleStatus status = resolveHandle(characteristic, handle);
    if (status != BleStatus::OK) {
        return status;
    }
    void* tag = beginOperation();
    read_target = out;
    read_capacity = capacity;
    read_length = 0;
    int rc = ble_gattc_read(conn_handle, handle, &NimbleLink::onReadDone, tag);
    if (rc != 0) {
        return mapGattStatus(rc);
    }
    status = awaitOperation(Config::Ble::gatt_timeout_ms);
    if (status == BleStatus::OK) {
        out_length = read_length;
    }
    return status;
}

void NimbleLink::disconnect() {
    handle_cache_count = 0;
    if (!connected) {
        return;
    }
    beginOperation();
    int rc = ble_gap_terminate(conn_handle, BLE_ERR_REM_USER_CONN_TERM);
    if (rc == 0) {
        // Completed by BLE_GAP_EVENT_DISCONNECT
        BleStatus status = awaitOperation(Config::Ble::terminate_timeout_ms);
        if (status != BleStatus::DISCONNECTED) {
            LOG_WARN(TAG, "Terminate not confirmed: %s", bleStatusName(status));
        }
    } else if (rc != BLE_HS_ENOTCONN) {
        LOG_WARN(TAG, "ble_gap_terminate failed: %d", rc);
    }
    connected = false;
}
