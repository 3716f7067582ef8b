/// @file changeset.hpp
/// @brief Umbrella header for the changeset-cpp library.
///
/// Include this single header for the core API: FileChange, the
/// result types, Error, the sandbox resolver, the filesystem primitives
/// and apply_changes(). JSON, loading, configuration and logging live in
/// their own headers.

#pragma once

#include <changeset-cpp/change.hpp>
#include <changeset-cpp/engine.hpp>
#include <changeset-cpp/error.hpp>
#include <changeset-cpp/file_system.hpp>
#include <changeset-cpp/result.hpp>
#include <changeset-cpp/sandbox.hpp>
