/// @file docpatch.hpp
/// @brief Umbrella header for the docpatch library.
///
/// Include this single header for access to all public types:
/// Node, Projection, LocatorQuery, EditRequest, AnchorPair, DiffRun,
/// PatchEngine, PatchResult, and Error. JSON support lives in
/// docpatch/json.hpp.

#pragma once

#include <docpatch/diff.hpp>
#include <docpatch/edit.hpp>
#include <docpatch/engine.hpp>
#include <docpatch/error.hpp>
#include <docpatch/locator.hpp>
#include <docpatch/mark.hpp>
#include <docpatch/node.hpp>
#include <docpatch/patch.hpp>
#include <docpatch/projection.hpp>
#include <docpatch/value.hpp>
