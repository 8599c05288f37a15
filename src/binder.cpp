#include "bindery/binder.hpp"
#include "bindery/element.hpp"
#include "errors.hpp"
#include "recording.hpp"

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace bindery {

// ---------------------------------------------------------------
// binder::impl
// ---------------------------------------------------------------

struct binder::impl {
    std::vector<element>* elements = nullptr;

    /// Modules already installed into this environment.
    std::unordered_set<const module*> installed;

    /// Names of the modules being configured, outermost first.  Shared
    /// with the binders of nested private modules.
    std::shared_ptr<std::vector<std::string>> module_stack;

    int* next_id = nullptr;
    bool capture_stacktraces = false;

    /// Set for the binder of a private module.
    private_elements* environment = nullptr;
};

binder::binder(std::unique_ptr<impl> p) : impl_(std::move(p)) {}

binder::~binder() = default;

std::string module::name() const {
    return internal::demangle(typeid(*this));
}

void private_module::configure(binder& b) {
    b.configure_private(*this);
}

void binder::install(const module_ptr& m) {
    if (!m) {
        add_error("install() called with a null module");
        return;
    }
    if (!impl_->installed.insert(m.get()).second) return;

    std::string name = m->name();
    impl_->module_stack->push_back(name);
    try {
        m->configure(*this);
    } catch (const std::exception& e) {
        record(internal::module_exception(name, e, std::current_exception()));
    }
    impl_->module_stack->pop_back();
}

void binder::configure_private(private_module& m) {
    auto env = std::make_shared<private_elements>();
    env->source.module_stack = *impl_->module_stack;
    env->source.declaring = m.name();

    auto p = std::make_unique<impl>();
    p->elements = &env->elements;
    p->module_stack = impl_->module_stack;
    p->next_id = impl_->next_id;
    p->capture_stacktraces = impl_->capture_stacktraces;
    p->environment = env.get();
    p->installed.insert(&m);

    private_binder pb(std::move(p));
    m.configure(pb);
    record(std::shared_ptr<const private_elements>(std::move(env)));
}

constant_builder binder::bind_constant(std::source_location loc) {
    return constant_builder(*this, make_source(loc));
}

void binder::add_error(std::string text, std::source_location loc) {
    record(message(error_id::user_reported, std::move(text), {make_source(loc)}));
}

void binder::add_error(message m) {
    record(std::move(m));
}

void binder::bind_scope(std::type_index annotation, std::shared_ptr<scope> s,
                        std::source_location loc) {
    record(scope_binding{annotation, std::move(s), make_source(loc)});
}

void binder::require_binding(const key& k, std::source_location loc) {
    record(require_binding_statement{k, make_source(loc)});
}

int binder::next_unique_id() {
    return ++*impl_->next_id;
}

bool binder::captures_stacktraces() const noexcept {
    return impl_->capture_stacktraces;
}

element_source binder::make_source(std::source_location loc) const {
    element_source source;
    source.location = loc;
    source.module_stack = *impl_->module_stack;
    if (impl_->capture_stacktraces) source.stacktrace = internal::capture_stacktrace();
    return source;
}

void binder::record(element e) {
    impl_->elements->push_back(std::move(e));
}

std::shared_ptr<binding> binder::record_binding(key k, std::source_location loc) {
    auto b = std::make_shared<binding>(std::move(k), make_source(loc));
    record(std::shared_ptr<const binding>(b));
    return b;
}

void binder::bind_aggregate(key k, std::shared_ptr<const provider_instance> view,
                            std::source_location loc) {
    record(std::make_shared<const binding>(std::move(k), make_source(loc),
                                           provider_instance_target{std::move(view)}));
}

// ---------------------------------------------------------------
// private_binder
// ---------------------------------------------------------------

private_binder::private_binder(std::unique_ptr<impl> p) : binder(std::move(p)) {}

private_binder::~private_binder() = default;

void private_binder::expose(const key& k, std::source_location loc) {
    impl_->environment->exposed.push_back(exposure{k, make_source(loc)});
}

// ---------------------------------------------------------------
// constant_builder
// ---------------------------------------------------------------

constant_builder::constant_builder(binder& b, element_source source)
    : binder_(&b), source_(std::move(source)) {}

constant_builder& constant_builder::annotated_with(qualifier q) {
    if (annotation_) {
        binder_->add_error(message(error_id::annotation_already_specified,
                                   "More than one annotation is specified for this binding.",
                                   {source_}));
        return *this;
    }
    annotation_ = std::move(q);
    return *this;
}

void constant_builder::to(std::string value) {
    bind_value(key::get<std::string>(), std::make_shared<std::string>(std::move(value)),
               &value_ops_for<std::string>());
}

void constant_builder::bind_value(key k, instance_ptr value, const value_ops* ops) {
    if (!annotation_) {
        binder_->add_error(message(error_id::missing_constant_annotation,
                                   "Constant bindings must be annotated.", {source_}));
        return;
    }
    binder_->record(std::make_shared<const binding>(k.with_annotation(annotation_), source_,
                                                    instance_target{std::move(value), ops}));
}

// ---------------------------------------------------------------
// Module evaluation
// ---------------------------------------------------------------

namespace internal {

std::vector<element> recording::record(const module_list& modules, int& next_id,
                                       bool capture_stacktraces) {
    std::vector<element> elements;
    auto p = std::make_unique<binder::impl>();
    p->elements = &elements;
    p->module_stack = std::make_shared<std::vector<std::string>>();
    p->next_id = &next_id;
    p->capture_stacktraces = capture_stacktraces;

    binder b(std::move(p));
    for (const auto& m : modules) b.install(m);
    return elements;
}

} // namespace internal

std::vector<element> get_elements(const module_list& modules) {
    int next_id = 0;
    return internal::recording::record(modules, next_id, false);
}

} // namespace bindery
