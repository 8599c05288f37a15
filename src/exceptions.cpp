#include "bindery/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace bindery {

std::string_view to_string(error_id id) noexcept {
    switch (id) {
    case error_id::binding_already_set:          return "binding_already_set";
    case error_id::jit_binding_already_set:      return "jit_binding_already_set";
    case error_id::child_binding_already_set:    return "child_binding_already_set";
    case error_id::missing_implementation:       return "missing_implementation";
    case error_id::missing_constructor:          return "missing_constructor";
    case error_id::jit_disabled:                 return "jit_disabled";
    case error_id::circular_dependency:          return "circular_dependency";
    case error_id::recursive_binding:            return "recursive_binding";
    case error_id::scope_not_found:              return "scope_not_found";
    case error_id::duplicate_scopes:             return "duplicate_scopes";
    case error_id::user_reported:                return "user_reported";
    case error_id::module_exception:             return "module_exception";
    case error_id::binding_to_null:              return "binding_to_null";
    case error_id::bad_exposure:                 return "bad_exposure";
    case error_id::implementation_already_set:   return "implementation_already_set";
    case error_id::mismatched_key_type:          return "mismatched_key_type";
    case error_id::annotation_already_specified: return "annotation_already_specified";
    case error_id::scope_already_set:            return "scope_already_set";
    case error_id::missing_constant_annotation:  return "missing_constant_annotation";
    case error_id::conversion_error:             return "conversion_error";
    case error_id::converter_returned_null:      return "converter_returned_null";
    case error_id::ambiguous_conversion:         return "ambiguous_conversion";
    case error_id::null_injected:                return "null_injected";
    case error_id::error_injecting_constructor:  return "error_injecting_constructor";
    case error_id::error_in_custom_provider:     return "error_in_custom_provider";
    case error_id::duplicate_element:            return "duplicate_element";
    case error_id::null_element:                 return "null_element";
    case error_id::duplicate_map_key:            return "duplicate_map_key";
    case error_id::null_value_in_map:            return "null_value_in_map";
    case error_id::out_of_scope:                 return "out_of_scope";
    case error_id::circular_proxies_disabled:    return "circular_proxies_disabled";
    }
    return "unknown";
}

// ---------------------------------------------------------------
// message
// ---------------------------------------------------------------

struct message::text_state {
    std::once_flag once;
    std::function<std::string()> render;
    std::string value;
    std::atomic<bool> rendered{false};
};

message::message(error_id id, std::string text,
                 std::vector<element_source> sources,
                 std::exception_ptr cause)
    : id_(id)
    , text_(std::make_shared<text_state>())
    , sources_(std::move(sources))
    , cause_(std::move(cause))
{
    text_->value = std::move(text);
    text_->rendered.store(true, std::memory_order_release);
}

message::message(error_id id, std::function<std::string()> render,
                 std::vector<element_source> sources)
    : id_(id)
    , text_(std::make_shared<text_state>())
    , sources_(std::move(sources))
{
    text_->render = std::move(render);
}

const std::string& message::text() const {
    if (text_->rendered.load(std::memory_order_acquire)) return text_->value;
    std::call_once(text_->once, [this] {
        text_->value = text_->render();
        text_->render = nullptr;
        text_->rendered.store(true, std::memory_order_release);
    });
    return text_->value;
}

bool message::is_rendered() const noexcept {
    return text_->rendered.load(std::memory_order_acquire);
}

message message::with_chain(std::vector<std::string> chain) const {
    message copy = *this;
    copy.chain_ = std::move(chain);
    return copy;
}

message message::with_source(element_source source) const {
    message copy = *this;
    copy.sources_.push_back(std::move(source));
    return copy;
}

bool message::operator==(const message& other) const {
    if (id_ != other.id_ || sources_.size() != other.sources_.size()) return false;
    for (std::size_t i = 0; i < sources_.size(); ++i) {
        if (sources_[i].to_string() != other.sources_[i].to_string()) return false;
    }
    return text() == other.text();
}

std::string format_messages(std::string_view heading, const std::vector<message>& messages) {
    std::string out(heading);
    out += ":\n\n";
    int index = 1;
    for (const auto& m : messages) {
        out += std::to_string(index++) + ") " + m.text() + "\n";
        for (const auto& source : m.sources()) {
            out += "  at " + source.to_string() + "\n";
        }
        for (const auto& line : m.chain()) {
            out += (line.starts_with("for ") ? "    " : "  ") + line + "\n";
        }
        out += "\n";
    }
    out += messages.size() == 1 ? std::string("1 error")
                                : std::to_string(messages.size()) + " errors";
    return out;
}

// ---------------------------------------------------------------
// di_error
// ---------------------------------------------------------------

namespace {

std::string format_message(const std::string& msg, const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":" + std::to_string(loc.line()) + "]";
}

} // namespace

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

// ---------------------------------------------------------------
// aggregate_error
// ---------------------------------------------------------------

struct aggregate_error::what_cache {
    std::once_flag once;
    std::string text;
};

aggregate_error::aggregate_error(std::string heading, std::vector<message> messages,
                                 std::source_location loc)
    : di_error(heading, loc)
    , heading_(std::move(heading))
    , messages_(std::move(messages))
    , cache_(std::make_shared<what_cache>())
{}

const char* aggregate_error::what() const noexcept {
    try {
        std::call_once(cache_->once, [this] {
            cache_->text = format_messages(heading_, messages_);
        });
        return cache_->text.c_str();
    } catch (const std::exception&) {
        return std::runtime_error::what();
    }
}

std::string aggregate_error::full_diagnostic() const {
    std::string out = what();
    for (const auto& m : messages_) {
        for (const auto& source : m.sources()) {
            std::string trace = internal::format_registration_trace(source);
            if (!trace.empty()) out += "\n" + trace;
        }
    }
    if (!diagnostic_detail().empty()) out += "\n" + diagnostic_detail();
    return out;
}

creation_error::creation_error(std::vector<message> messages, std::source_location loc)
    : aggregate_error("Unable to create injector, see the following errors",
                      std::move(messages), loc)
{}

configuration_error::configuration_error(std::vector<message> messages,
                                         std::source_location loc)
    : aggregate_error("Configuration errors", std::move(messages), loc)
{}

provision_error::provision_error(std::vector<message> messages, std::source_location loc)
    : aggregate_error("Unable to provision, see the following errors",
                      std::move(messages), loc)
{}

std::exception_ptr provision_error::cause() const noexcept {
    for (const auto& m : messages()) {
        if (m.cause()) return m.cause();
    }
    return nullptr;
}

out_of_scope_error::out_of_scope_error(const std::string& message, std::source_location loc)
    : di_error(message, loc)
{}

} // namespace bindery
