/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace inkwash {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Input path does not exist.
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) : Error(message) {}
};

// Input exists but is not something the resolver can turn into pages.
class UnsupportedInputError : public Error {
public:
    explicit UnsupportedInputError(const std::string& message) : Error(message) {}
};

class ArchiveError : public Error {
public:
    explicit ArchiveError(const std::string& message) : Error(message) {}
};

class ImageError : public Error {
public:
    explicit ImageError(const std::string& message) : Error(message) {}
};

class EngineError : public Error {
public:
    explicit EngineError(const std::string& message) : Error(message) {}
};

}
