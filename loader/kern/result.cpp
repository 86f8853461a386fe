/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/result.h"

const char* ErrorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::UnsupportedArchitecture:
            return "UnsupportedArchitecture";
        case ErrorKind::UnknownFirmware:
            return "UnknownFirmware";
        case ErrorKind::NoMemoryMap:
            return "NoMemoryMap";
        case ErrorKind::MemoryMapTooLarge:
            return "MemoryMapTooLarge";
        case ErrorKind::NoBootableDevice:
            return "NoBootableDevice";
        case ErrorKind::DeviceReadFailed:
            return "DeviceReadFailed";
        case ErrorKind::InvalidKernelFormat:
            return "InvalidKernelFormat";
        case ErrorKind::UnsupportedCompression:
            return "UnsupportedCompression";
        case ErrorKind::HeaderChecksumMismatch:
            return "HeaderChecksumMismatch";
        case ErrorKind::InsufficientStagingMemory:
            return "InsufficientStagingMemory";
        case ErrorKind::DecompressionFailed:
            return "DecompressionFailed";
        case ErrorKind::StagingOverflow:
            return "StagingOverflow";
        case ErrorKind::BootInfoTooLarge:
            return "BootInfoTooLarge";
        case ErrorKind::PagingSetupFailed:
            return "PagingSetupFailed";
        case ErrorKind::StackAllocationFailed:
            return "StackAllocationFailed";
        case ErrorKind::FirmwareExitFailed:
            return "FirmwareExitFailed";
    }
    return "Unknown";
}

bool IsDeviceError(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::DeviceReadFailed:
        case ErrorKind::InvalidKernelFormat:
        case ErrorKind::UnsupportedCompression:
        case ErrorKind::HeaderChecksumMismatch:
            return true;
        default:
            return false;
    }
}
