// SPDX-FileCopyrightText: 2021-2025 Filipe Coelho <falktx@falktx.com>
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "device-listing.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

// --------------------------------------------------------------------------------------------------------------------

static std::string toLower(std::string str)
{
    for (char& c : str)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return str;
}

static bool isDefault(const std::optional<int>& defaultIndex, const int index) noexcept
{
    return defaultIndex && *defaultIndex == index;
}

// --------------------------------------------------------------------------------------------------------------------

bool parseDeviceSortOrder(const char* const str, DeviceSortOrder& order)
{
    if (std::strcmp(str, "index") == 0)
        order = kSortByIndex;
    else if (std::strcmp(str, "name") == 0)
        order = kSortByName;
    else if (std::strcmp(str, "in") == 0)
        order = kSortByInputs;
    else if (std::strcmp(str, "out") == 0)
        order = kSortByOutputs;
    else
        return false;

    return true;
}

void sortDevices(std::vector<DeviceDescriptor>& devices, const DeviceSortOrder order)
{
    switch (order)
    {
    case kSortByIndex:
        break;
    case kSortByName:
        std::stable_sort(devices.begin(), devices.end(), [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
            return toLower(a.name) < toLower(b.name);
        });
        break;
    case kSortByInputs:
        std::stable_sort(devices.begin(), devices.end(), [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
            return a.maxInputChannels > b.maxInputChannels;
        });
        break;
    case kSortByOutputs:
        std::stable_sort(devices.begin(), devices.end(), [](const DeviceDescriptor& a, const DeviceDescriptor& b) {
            return a.maxOutputChannels > b.maxOutputChannels;
        });
        break;
    }
}

std::string formatDeviceLine(const DeviceDescriptor& device,
                             const int index,
                             const HostApiTable& hostApis,
                             const DefaultDeviceIndices& defaults,
                             const bool showSampleRate)
{
    char buf[64];
    std::string line = "  [" + std::to_string(index) + "] ";

    line += device.name.empty() ? "<unknown>" : device.name;
    line += " - ";
    line += getHostApiName(hostApis, device.hostApiId);

    std::snprintf(buf, sizeof(buf), " | in:%u out:%u", device.maxInputChannels, device.maxOutputChannels);
    line += buf;

    if (showSampleRate)
    {
        if (device.defaultSampleRate && *device.defaultSampleRate != 0.0)
            std::snprintf(buf, sizeof(buf), " | sr: %ld", static_cast<long>(*device.defaultSampleRate));
        else
            std::snprintf(buf, sizeof(buf), " | sr: N/A");
        line += buf;
    }

    const bool defaultInput = isDefault(defaults.input, index);
    const bool defaultOutput = isDefault(defaults.output, index);

    if (defaultInput && defaultOutput)
        line += " (default input, default output)";
    else if (defaultInput)
        line += " (default input)";
    else if (defaultOutput)
        line += " (default output)";

    return line;
}

nlohmann::json devicesToJson(const std::vector<DeviceDescriptor>& devices,
                             const HostApiTable& hostApis,
                             const DefaultDeviceIndices& defaults)
{
    nlohmann::json array = nlohmann::json::array();

    for (const DeviceDescriptor& device : devices)
    {
        nlohmann::json obj;
        obj["index"] = device.index;
        obj["name"] = device.name;
        obj["hostapi"] = getHostApiName(hostApis, device.hostApiId);
        obj["max_input_channels"] = device.maxInputChannels;
        obj["max_output_channels"] = device.maxOutputChannels;

        if (device.defaultSampleRate)
            obj["default_samplerate"] = *device.defaultSampleRate;
        else
            obj["default_samplerate"] = nullptr;

        obj["is_default_input"] = isDefault(defaults.input, device.index);
        obj["is_default_output"] = isDefault(defaults.output, device.index);

        array.push_back(std::move(obj));
    }

    return array;
}

bool listDevices(AudioHost& host,
                 const DeviceSortOrder order,
                 const bool json,
                 const bool showSampleRate,
                 FILE* const out)
{
    DeviceCatalog catalog;
    AudioError error;

    if (! queryDeviceCatalog(host, catalog, error))
    {
        fprintf(out, "Failed to query audio devices: %s\n", error.message.c_str());
        return false;
    }

    sortDevices(catalog.devices, order);

    if (json)
    {
        const std::string dump = devicesToJson(catalog.devices, catalog.hostApis, catalog.defaults).dump(2);
        fprintf(out, "%s\n", dump.c_str());
        return true;
    }

    fprintf(out, "Audio input devices:\n");
    for (const DeviceDescriptor& device : catalog.devices)
    {
        if (device.maxInputChannels > 0)
            fprintf(out, "%s\n", formatDeviceLine(device, device.index, catalog.hostApis, catalog.defaults,
                                                  showSampleRate).c_str());
    }

    fprintf(out, "\nAudio output devices:\n");
    for (const DeviceDescriptor& device : catalog.devices)
    {
        if (device.maxOutputChannels > 0)
            fprintf(out, "%s\n", formatDeviceLine(device, device.index, catalog.hostApis, catalog.defaults,
                                                  showSampleRate).c_str());
    }

    return true;
}

// --------------------------------------------------------------------------------------------------------------------
