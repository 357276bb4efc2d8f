/// basic_usage.cpp: libsvcloc introductory example.
///
/// Demonstrates the register -> validate -> resolve workflow:
///   1. Define interfaces and implementations (no framework base classes).
///   2. Register types, ready-made instances and factories.
///   3. Call validate() to check every registration up front.
///   4. Resolve fresh objects with create<T>() and shared ones with singleton<T>().

#include <libsvcloc.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace libsvcloc;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_clock {
    virtual ~i_clock() = default;
    virtual long now() const = 0;
};

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

struct i_repository {
    virtual ~i_repository() = default;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct fixed_clock : i_clock {
    long now() const override { return 1700000000; }
};

struct console_logger : i_logger {
    explicit console_logger(std::string prefix) : prefix_(std::move(prefix)) {}

    void log(const std::string& message) override {
        std::cout << prefix_ << message << '\n';
    }

private:
    std::string prefix_;
};

struct greeter : i_greeter {
    greeter(std::shared_ptr<i_logger> logger, std::shared_ptr<i_clock> clock)
        : logger_(std::move(logger)), clock_(std::move(clock)) {}

    std::string greet(const std::string& name) override {
        const auto msg = "Hello, " + name + "! (t=" + std::to_string(clock_->now()) + ')';
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
    std::shared_ptr<i_clock> clock_;
};

// Only constructible with a connection string: type registration cannot
// build it.
struct sql_repository : i_repository {
    explicit sql_repository(std::string connection) : connection_(std::move(connection)) {}

private:
    std::string connection_;
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // ── Registration phase ────────────────────────────────────────────
    auto& reg = locator::default_registry();

    // fixed_clock: built by its parameterless constructor.
    reg.add_type<i_clock, fixed_clock>();

    // console_logger: one ready-made object shared by every caller.
    reg.add_instance<i_logger>(std::make_shared<console_logger>("[LOG] "));

    // greeter: a factory wires its dependencies through the resolver.
    reg.add_factory<i_greeter, greeter>([] {
        return std::make_shared<greeter>(locator::singleton<i_logger>(),
                                         locator::singleton<i_clock>());
    });

    // ── Validation phase ──────────────────────────────────────────────
    if (auto checked = locator::validate(); checked.is_error()) {
        std::cerr << "Unexpected validation failure: " << checked.error().message() << '\n';
        return 1;
    }

    // A broken registration is reported, not thrown.
    reg.add_type<i_repository, sql_repository>();
    locator::validate().on_error([](const error& e) {
        for (const auto& inner : e.errors()) {
            std::cout << "Validation: " << inner.message() << '\n';
        }
    });

    // ── Resolution phase ──────────────────────────────────────────────

    // create<T>() builds a new greeter per call; singleton<T>() caches one.
    const auto g1 = locator::create<i_greeter>();
    const auto g2 = locator::create<i_greeter>();
    const auto s1 = locator::singleton<i_greeter>();
    const auto s2 = locator::singleton<i_greeter>();
    std::cout << "create() distinct:    " << std::boolalpha << (g1.get() != g2.get()) << '\n';
    std::cout << "singleton() shared:   " << (s1.get() == s2.get()) << '\n';
    g1->greet("World");

    // A private resolver has its own singleton cache.
    auto isolated = locator::create_resolver();
    std::cout << "isolated cache:       "
              << (isolated->singleton<i_greeter>().get() != s1.get()) << '\n';

    try {
        locator::create<i_repository>();
    } catch (const no_valid_constructor& e) {
        std::cout << "Resolution failed: " << e.what() << '\n';
    }

    std::cout << "Done.\n";
    return 0;
}
