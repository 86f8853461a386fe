/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2018 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/statuscode.h>

// Every way in which booting can fail; the name ends up on the halt line
enum class ErrorKind : unsigned int {
    None = 0,
    // Platform probe
    UnsupportedArchitecture,
    UnknownFirmware,
    // Memory map
    NoMemoryMap,
    MemoryMapTooLarge,
    // Boot devices
    NoBootableDevice,
    // Image loader; these cause the next device to be tried
    DeviceReadFailed,
    InvalidKernelFormat,
    UnsupportedCompression,
    HeaderChecksumMismatch,
    // Decompressor
    InsufficientStagingMemory,
    DecompressionFailed,
    StagingOverflow,
    // Boot information
    BootInfoTooLarge,
    // Hand-off
    PagingSetupFailed,
    StackAllocationFailed,
    FirmwareExitFailed,
};

const char* ErrorKindName(ErrorKind kind);

// Whether a failure while loading from a device allows the next one to be tried
bool IsDeviceError(ErrorKind kind);

class Result
{
  public:
    explicit constexpr Result(const statuscode_t statuscode) : r_StatusCode(statuscode) {}

    bool IsSuccess() const { return ferry_statuscode_is_success(r_StatusCode); }

    bool IsFailure() const { return !IsSuccess(); }

    ErrorKind AsErrorKind() const
    {
        return IsFailure() ? static_cast<ErrorKind>(ferry_statuscode_extract_error(r_StatusCode))
                           : ErrorKind::None;
    }

    constexpr statuscode_t AsStatusCode() const { return r_StatusCode; }
    constexpr auto AsValue() const { return static_cast<unsigned int>(r_StatusCode); }

    static Result Failure(ErrorKind kind)
    {
        return Result(ferry_statuscode_make_failure(static_cast<unsigned int>(kind)));
    }

    static Result Success(unsigned int value = 0) { return Result(ferry_statuscode_make_success(value)); }

  private:
    statuscode_t r_StatusCode;
};

#define RESULT_MAKE_FAILURE(kind) Result::Failure(ErrorKind::kind)

#define RESULT_PROPAGATE_FAILURE(x)         \
    do {                                    \
        if (auto result_ = (x);             \
            result_.IsFailure())            \
            return result_;                 \
    } while (0)
