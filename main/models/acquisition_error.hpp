#ifndef ACQUISITION_ERROR_HPP
#define ACQUISITION_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/ble_status.hpp>
#include <main/models/sensor_kind.hpp>

enum class ErrorKind : uint8_t {
    NONE       = 0,
    CONNECTION = 1,   // link could not be established
    DISCONNECT = 2,   // link dropped on every allowed attempt
    GATT       = 3,   // write/read rejected while the link stayed up
    DECODE     = 4,   // raw value length does not match the sensor layout
    PUBLISH    = 5,   // some records of a decoded batch were not published
    CANCELLED  = 6,
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:       return "none";
        case ErrorKind::CONNECTION: return "ConnectionError";
        case ErrorKind::DISCONNECT: return "DisconnectError";
        case ErrorKind::GATT:       return "GattError";
        case ErrorKind::DECODE:     return "DecodeError";
        case ErrorKind::PUBLISH:    return "PublishError";
        case ErrorKind::CANCELLED:  return "Cancelled";
    }
    return "unknown";
}

// Filled by a codec when the raw buffer does not fit its layout
struct DecodeError {
    SensorKind  kind;
    std::size_t received_length;
    std::size_t expected_length;
};

struct AcquisitionError {
    ErrorKind   kind;
    SensorKind  sensor;            // sensor being handled when the error occurred
    std::size_t received_length;   // DECODE only
    std::size_t expected_length;   // DECODE only
    unsigned    attempts;          // session attempts made (DISCONNECT, CONNECTION)
    BleStatus   ble_status;

    static AcquisitionError none() {
        return AcquisitionError{ErrorKind::NONE, SensorKind::TEMPERATURE, 0, 0, 0, BleStatus::OK};
    }

    static AcquisitionError fromDecode(const DecodeError& decode) {
        return AcquisitionError{ErrorKind::DECODE, decode.kind, decode.received_length,
                                decode.expected_length, 0, BleStatus::OK};
    }
};

#endif // ACQUISITION_ERROR_HPP
