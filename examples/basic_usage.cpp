/// basic_usage.cpp: bindery introductory example.
///
/// Demonstrates the module -> injector -> instance workflow:
///   1. Define interfaces and implementations; constructors are declared
///      with `using inject = bindery::inject<...>`.
///   2. Describe the object graph in modules.
///   3. Call create_injector() to validate the whole graph up front.
///   4. Ask the injector for instances; contribute plugins through a
///      multibinder; build a child injector for per-request bindings.

#include <bindery.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace bindery;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

struct i_plugin {
    virtual ~i_plugin() = default;
    virtual std::string name() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::cout << "[LOG] " << message << '\n';
    }
};

struct greeter : i_greeter {
    using inject = bindery::inject<i_logger, annotated<std::string, name<"greeting">>>;

    greeter(std::shared_ptr<i_logger> logger, std::shared_ptr<std::string> greeting)
        : logger_(std::move(logger)), greeting_(std::move(greeting)) {}

    std::string greet(const std::string& name) override {
        const auto msg = *greeting_ + ", " + name + '!';
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
    std::shared_ptr<std::string> greeting_;
};

struct audit_plugin : i_plugin {
    std::string name() const override { return "audit"; }
};

struct metrics_plugin : i_plugin {
    std::string name() const override { return "metrics"; }
};

struct request_context {
    using inject = bindery::inject<annotated<int, name<"request_id">>>;

    explicit request_context(std::shared_ptr<int> id) : id_(*id) {}

    std::string request_id() const { return "req-" + std::to_string(id_); }

private:
    int id_;
};

// -----------------------------------------------------------------------
// Modules
// -----------------------------------------------------------------------

struct app_module : module {
    void configure(binder& b) override {
        // console_logger: one instance for the whole application.
        b.bind<i_logger>().to<console_logger>().in<singleton>();
        b.bind<i_greeter>().to<greeter>();
        b.bind_constant().annotated_with(named("greeting")).to("Hello");
        b.bind_constant().annotated_with(named("workers")).to("4");
    }

    std::string name() const override { return "app_module"; }
};

struct plugins_module : module {
    void configure(binder& b) override {
        auto plugins = multibinder<i_plugin>::new_set_binder(b);
        plugins.add_binding().to<audit_plugin>();
        plugins.add_binding().to<metrics_plugin>();
    }

    std::string name() const override { return "plugins_module"; }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // Only warnings and errors from the injector reach the console.
    boost::log::core::get()->set_filter(
        boost::log::trivial::severity >= boost::log::trivial::warning);

    // Build phase: every binding is linked and validated here.
    auto injector = create_injector({std::make_shared<app_module>(),
                                     std::make_shared<plugins_module>()},
                                    {.stage = stage::production});

    // Singleton logger, unscoped greeter.
    const auto g1 = injector->get_instance<i_greeter>();
    const auto g2 = injector->get_instance<i_greeter>();
    assert(g1.get() != g2.get() && "unscoped bindings produce fresh instances");
    std::cout << g1->greet("World") << '\n';

    // The string constant converts to the requested type.
    std::cout << "Workers: " << *injector->get_instance<int>(named("workers")) << '\n';

    for (const auto& plugin : *injector->get_instance<set_of<i_plugin>>()) {
        std::cout << "Plugin: " << plugin->name() << '\n';
    }

    // Per-request bindings live in child injectors.
    for (int id = 1; id <= 2; ++id) {
        auto request = injector->create_child_injector({make_module([id](binder& b) {
            b.bind<int>(named("request_id")).to_instance(id);
        }, "request_module")});
        std::cout << "Request id: " << request->get_instance<request_context>()->request_id()
                  << '\n';
    }

    // Configuration problems are reported together, with their sources.
    try {
        injector->get_instance<i_plugin>();
    } catch (const configuration_error& e) {
        std::cout << e.what() << '\n';
    }

    std::cout << "Done.\n";
    return 0;
}
