/**
 * Translation of runtime-boundary failures into the sandkit taxonomy
 */
#pragma once
#include <string>
#include <utility>
#include "docker/errors.hpp"
#include "util/errors.hpp"

namespace sandkit::runtime {

// Run fn, rethrowing Docker-layer failures as EngineFault prefixed with
// context. SandboxError subclasses pass through untouched.
template <typename Fn>
auto translate_engine_errors(const std::string& context, Fn&& fn) -> decltype(fn()) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const docker::ApiError& e) {
        throw EngineFault(context + ": " + e.what());
    } catch (const docker::TransportError& e) {
        throw EngineFault(context + ": " + e.what());
    } catch (const docker::ArchiveError& e) {
        throw EngineFault(context + ": " + e.what());
    }
}

} // namespace sandkit::runtime
