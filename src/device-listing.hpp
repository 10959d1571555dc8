// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#pragma once

#include "audio-host.hpp"

#include <nlohmann/json.hpp>

// --------------------------------------------------------------------------------------------------------------------

enum DeviceSortOrder {
    kSortByIndex = 0,
    kSortByName,
    kSortByInputs,
    kSortByOutputs,
};

// "index", "name", "in" or "out"
bool parseDeviceSortOrder(const char* str, DeviceSortOrder& order);

// stable sort, catalog order is kept for equal keys
void sortDevices(std::vector<DeviceDescriptor>& devices, DeviceSortOrder order);

std::string formatDeviceLine(const DeviceDescriptor& device,
                             int index,
                             const HostApiTable& hostApis,
                             const DefaultDeviceIndices& defaults,
                             bool showSampleRate);

nlohmann::json devicesToJson(const std::vector<DeviceDescriptor>& devices,
                             const HostApiTable& hostApis,
                             const DefaultDeviceIndices& defaults);

// query and print the device catalog, returns false if the query failed
bool listDevices(AudioHost& host, DeviceSortOrder order, bool json, bool showSampleRate, FILE* out);

// --------------------------------------------------------------------------------------------------------------------
