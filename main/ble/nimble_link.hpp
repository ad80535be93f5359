#ifndef NIMBLE_LINK_HPP
#define NIMBLE_LINK_HPP

#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <host/ble_hs.h>
#include <main/ble/ble_link.hpp>

// BLE central on the ESP-IDF NimBLE host. GATT procedures are asynchronous
// in NimBLE; every call here starts one procedure and blocks the calling task
// on a semaphore until the host task reports completion or the timeout
// expires. Only one instance may exist (NimBLE callbacks are routed to it).
class NimbleLink : public BleLink {
public:
    NimbleLink();
    ~NimbleLink() override;

    NimbleLink(const NimbleLink&) = delete;
    NimbleLink& operator=(const NimbleLink&) = delete;

    // Bring up the NimBLE host and wait for it to sync with the controller
    bool startHost(uint32_t timeout_ms);

    BleStatus connect(const char* address) override;
    BleStatus write(const GattUuid& characteristic, const uint8_t* data, std::size_t length,
                    bool with_response) override;
    BleStatus read(const GattUuid& characteristic, uint8_t* out, std::size_t capacity,
                   std::size_t& out_length) override;
    void disconnect() override;

    static bool parseAddress(const char* address, ble_addr_t& out);

private:
    struct HandleEntry {
        GattUuid uuid;
        uint16_t value_handle;
    };
    static constexpr std::size_t HANDLE_CACHE_SIZE = 8;

    // Host task side
    static void hostTask(void* param);
    static void onSync();
    static void onReset(int reason);
    static int onGapEvent(struct ble_gap_event* event, void* arg);
    static int onChrDiscovered(uint16_t conn_handle, const struct ble_gatt_error* error,
                               const struct ble_gatt_chr* chr, void* arg);
    static int onWriteDone(uint16_t conn_handle, const struct ble_gatt_error* error,
                           struct ble_gatt_attr* attr, void* arg);
    static int onReadDone(uint16_t conn_handle, const struct ble_gatt_error* error,
                          struct ble_gatt_attr* attr, void* arg);

    // Caller side
    void* beginOperation();
    BleStatus awaitOperation(uint32_t timeout_ms);
    void completeOperation(void* op_tag, BleStatus status);
    bool isCurrent(void* op_tag) const;
    BleStatus mapGattStatus(int status) const;
    BleStatus resolveHandle(const GattUuid& characteristic, uint16_t& out_handle);

    StaticSemaphore_t op_done_buffer;
    SemaphoreHandle_t op_done;
    StaticSemaphore_t synced_buffer;
    SemaphoreHandle_t synced;

    volatile uint32_t op_id;
    volatile BleStatus op_status;
    volatile bool connected;
    volatile uint16_t conn_handle;
    uint8_t own_addr_type;

    // Results written by the host task for the current operation
    uint16_t found_handle;
    uint8_t* read_target;
    std::size_t read_capacity;
    std::size_t read_length;

    HandleEntry handle_cache[HANDLE_CACHE_SIZE];
    std::size_t handle_cache_count;
};

#endif // NIMBLE_LINK_HPP
