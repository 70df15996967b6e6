/// @file error.cpp
/// @brief Error formatting and exception conversion for sker_core

#include <sker/core/error.hpp>
#include <sstream>

namespace sker_core {

// =============================================================================
// Kind Formatting
// =============================================================================

namespace detail {

std::string format_kind(const EventError& err) {
    std::ostringstream oss;
    oss << "[EventError] " << err.message;
    if (!err.event.empty()) {
        oss << " (event: " << err.event << ")";
    }
    return oss.str();
}

std::string format_kind(const LifecycleError& err) {
    std::ostringstream oss;
    oss << "[LifecycleError] " << err.message;
    if (!err.hook.empty()) {
        oss << " (hook: " << err.hook << ", phase: " << err.phase << ")";
    }
    return oss.str();
}

std::string format_kind(const PluginError& err) {
    std::ostringstream oss;
    oss << "[PluginError] " << err.message;
    if (!err.plugin_id.empty()) {
        oss << " (plugin: " << err.plugin_id << ")";
    }
    if (!err.phase.empty()) {
        oss << " (phase: " << err.phase << ")";
    }
    return oss.str();
}

std::string format_kind(const MiddlewareError& err) {
    std::ostringstream oss;
    oss << "[MiddlewareError] " << err.message;
    if (!err.executed.empty()) {
        oss << " (executed:";
        for (const auto& name : err.executed) {
            oss << " " << name;
        }
        oss << ")";
    }
    return oss.str();
}

std::string format_kind(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;
    return oss.str();
}

std::string format_kind(const std::string& message) {
    return message;
}

void append_chain(std::ostringstream& oss, const Error& error, int depth) {
    std::string indent(static_cast<std::size_t>(depth) * 2, ' ');

    oss << "[" << error_code_name(error.code()) << "] ";
    std::visit([&oss](const auto& err) { oss << format_kind(err); }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    if (const Error* cause = error.cause()) {
        oss << "\n" << indent << "  caused by: ";
        append_chain(oss, *cause, depth + 1);
    }

    for (const auto& child : error.children()) {
        oss << "\n" << indent << "  - ";
        append_chain(oss, child, depth + 1);
    }
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    detail::append_chain(oss, error, 0);
    return oss.str();
}

// =============================================================================
// Exception Conversion
// =============================================================================

Error error_from_exception(const std::exception& e, ErrorCode code) {
    return Error(code, e.what());
}

Error error_from_current_exception(ErrorCode code) {
    try {
        throw;
    } catch (const std::exception& e) {
        return error_from_exception(e, code);
    } catch (const Error& e) {
        return e;
    } catch (const std::string& s) {
        return Error(code, s);
    } catch (const char* s) {
        return Error(code, s);
    } catch (...) {
        return Error(code, "unknown exception");
    }
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::int64_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;

} // namespace sker_core
