#include "core/file_type_sniffer.hpp"
#include <algorithm>
#include <cstring>
#include <unordered_map>
#include <unordered_set>

namespace
{
    // Keeps embedded NUL bytes that a plain const char* constructor would cut off
    template <size_t N>
    std::string bytes(const char (&literal)[N])
    {
        return std::string(literal, N - 1);
    }

    bool startsWith(const uint8_t *data, size_t size, const std::string &magic)
    {
        return magic.size() <= size && std::memcmp(data, magic.data(), magic.size()) == 0;
    }
}

const std::vector<FileSignature> &FileTypeSniffer::signatureTable()
{
    static const std::vector<FileSignature> table = {
        // Archives
        {bytes("PK\x03\x04"), "zip"},
        {bytes("PK\x05\x06"), "zip"},
        {bytes("PK\x07\x08"), "zip"},
        {bytes("Rar!\x1A\x07\x00"), "rar"},
        {bytes("Rar!\x1A\x07\x01\x00"), "rar"},
        {bytes("7z\xBC\xAF\x27\x1C"), "7z"},
        // Documents and executables
        {bytes("%PDF"), "pdf"},
        {bytes("MZ"), "exe"},
        {bytes("\x7F" "ELF"), "elf"},
        // ISO-BMFF family; the avif brand must win over the generic box sizes
        {bytes("\x00\x00\x00\x1c" "ftypavif"), "avif"},
        {bytes("\x00\x00\x00\x18" "ftyp"), "mp4"},
        {bytes("\x00\x00\x00\x20" "ftyp"), "mp4"},
        // RIFF without a recognisable form type
        {bytes("RIFF"), "avi"},
        {bytes("ftypqt"), "mov"},
        {bytes("moov"), "mov"},
        {bytes("free"), "mov"},
        {bytes("\x1A\x45\xDF\xA3"), "mkv"},
        {bytes("fLaC"), "flac"},
        {bytes("ID3"), "mp3"},
        // Raster images
        {bytes("\x89PNG"), "png"},
        {bytes("\xFF\xD8\xFF"), "jpeg"},
        {bytes("GIF89a"), "gif"},
        {bytes("GIF87a"), "gif"},
        {bytes("BM"), "bmp"},
        {bytes("II\x2A\x00"), "tiff"},
        {bytes("MM\x00\x2A"), "tiff"},
        {bytes("8BPS"), "psd"},
        {bytes("\x00\x00\x01\x00"), "ico"},
        {bytes("\xD0\xCF\x11\xE0\xA1\xB1\x1A\xE1"), "doc"},
        // Text formats
        {bytes("<!DOCTYP"), "html"},
        {bytes("<!doctype"), "html"},
        {bytes("#!/usr/bin/env python"), "py"},
        {bytes("#!/usr/bin/python"), "py"},
        {bytes("#!/bin/bash"), "sh"},
        {bytes("#!/bin/sh"), "sh"},
        {bytes("#!/usr/bin/perl"), "pl"},
        {bytes("<?php"), "php"},
        {bytes("#include <"), "cpp"},
        // Weak fallbacks, only reached when nothing longer matched
        {bytes("#!"), "pl"},
        {bytes("# "), "sh"},
        {bytes("#i"), "php"},
        {bytes("***"), "cpp"},
        {bytes("\n"), "py"},
    };
    return table;
}

std::optional<std::string> FileTypeSniffer::identifyType(const uint8_t *data, size_t size)
{
    if (data == nullptr || size < 2)
    {
        return std::nullopt;
    }

    // RIFF is a container; the form type at offset 8 tells the formats apart
    if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0)
    {
        const uint8_t *form = data + 8;
        if (std::memcmp(form, "AVI ", 4) == 0)
            return std::string("avi");
        if (std::memcmp(form, "WAVE", 4) == 0)
            return std::string("wav");
        if (std::memcmp(form, "WEBP", 4) == 0)
            return std::string("webp");
    }

    for (const auto &signature : signatureTable())
    {
        if (startsWith(data, size, signature.magic))
        {
            return signature.file_type;
        }
    }
    return std::nullopt;
}

std::optional<std::string> FileTypeSniffer::identifyType(const std::vector<uint8_t> &data)
{
    return identifyType(data.data(), data.size());
}

std::string FileTypeSniffer::extensionFor(const std::string &file_type)
{
    static const std::unordered_map<std::string, std::string> extensions = {
        {"png", ".png"}, {"jpeg", ".jpg"}, {"gif", ".gif"}, {"bmp", ".bmp"},
        {"tiff", ".tiff"}, {"webp", ".webp"}, {"avif", ".avif"}, {"ico", ".ico"},
        {"psd", ".psd"}, {"pdf", ".pdf"}, {"doc", ".doc"}, {"docx", ".docx"},
        {"html", ".html"}, {"mp3", ".mp3"}, {"wav", ".wav"}, {"flac", ".flac"},
        {"mp4", ".mp4"}, {"avi", ".avi"}, {"mov", ".mov"}, {"mkv", ".mkv"},
        {"zip", ".zip"}, {"rar", ".rar"}, {"7z", ".7z"}, {"exe", ".exe"},
        {"elf", ".elf"}, {"py", ".py"}, {"pl", ".pl"}, {"php", ".php"},
        {"cpp", ".cpp"}, {"sh", ".sh"}};

    auto it = extensions.find(file_type);
    if (it != extensions.end())
    {
        return it->second;
    }
    return "." + file_type;
}

bool FileTypeSniffer::isRasterImageType(const std::string &file_type)
{
    static const std::unordered_set<std::string> raster = {
        "jpeg", "png", "gif", "bmp", "webp", "tiff", "avif"};
    return raster.count(file_type) > 0;
}
