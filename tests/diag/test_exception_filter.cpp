#include <catch2/catch_test_macros.hpp>
#include "tether/diag/ExceptionFilter.hpp"
#include "tether/scan/Signatures.hpp"
#include "utils/FakeSubsystems.hpp"

#include <optional>
#include <vector>

#ifndef _WIN32
#include <csignal>
#endif

using namespace tether;
using tether::test::FakeSigScanner;

namespace {

class RecordingInstaller : public IExceptionFilterInstaller {
public:
    std::optional<uintptr_t> Install(uintptr_t filter) override {
        calls.push_back(filter);
        if (refuse)
            return std::nullopt;
        uintptr_t previous = current;
        current = filter;
        return previous;
    }

    uintptr_t current = 0x7FF00010;
    bool refuse = false;
    std::vector<uintptr_t> calls;
};

#ifndef _WIN32
void SegvHandler(int, siginfo_t*, void*) {}
void PlainSegvHandler(int) {}

struct sigaction CurrentSegvAction() {
    struct sigaction current{};
    sigaction(SIGSEGV, nullptr, &current);
    return current;
}

// Puts the test process's own SIGSEGV action back when a test ends.
class SegvActionGuard {
public:
    SegvActionGuard() { sigaction(SIGSEGV, nullptr, &saved_); }
    ~SegvActionGuard() { sigaction(SIGSEGV, &saved_, nullptr); }

private:
    struct sigaction saved_{};
};
#endif

} // namespace

TEST_CASE("ExceptionFilter - replace with the host filter", "[diag][exfilter]") {
    FakeSigScanner scanner;
    RecordingInstaller installer;

    SECTION("Host filter found") {
        scanner.named[sig::kExceptionFilter] = 0x140777000;

        auto previous = ExceptionFilter::Replace(scanner, installer);
        REQUIRE(previous == uintptr_t{ 0x7FF00010 });
        REQUIRE(installer.current == 0x140777000);

        ExceptionFilter::Restore(installer, *previous);
        REQUIRE(installer.current == 0x7FF00010);
        REQUIRE(installer.calls.size() == 2);
    }

    SECTION("Host filter missing leaves the current one") {
        REQUIRE_FALSE(ExceptionFilter::Replace(scanner, installer).has_value());
        REQUIRE(installer.calls.empty());
        REQUIRE(installer.current == 0x7FF00010);
    }

    SECTION("Platform refusing the change is not a success") {
        scanner.named[sig::kExceptionFilter] = 0x140777000;
        installer.refuse = true;

        REQUIRE_FALSE(ExceptionFilter::Replace(scanner, installer).has_value());
        REQUIRE_FALSE(ExceptionFilter::Restore(installer, 0x7FF00010));
        REQUIRE(installer.current == 0x7FF00010);
    }
}

#ifndef _WIN32
TEST_CASE("ExceptionFilter - native installer swaps the SIGSEGV action", "[diag][exfilter][posix]") {
    auto installer = CreateNativeExceptionFilterInstaller();
    REQUIRE(installer != nullptr);

    SegvActionGuard guard;

    auto handler = reinterpret_cast<uintptr_t>(&SegvHandler);
    auto original = installer->Install(handler);
    REQUIRE(original.has_value());

    auto current = CurrentSegvAction();
    REQUIRE((current.sa_flags & SA_SIGINFO) != 0);
    REQUIRE(current.sa_sigaction == &SegvHandler);

    REQUIRE(installer->Reinstate(*original));
    REQUIRE(reinterpret_cast<uintptr_t>(CurrentSegvAction().sa_sigaction) != handler);
}

TEST_CASE("ExceptionFilter - native installer restores non-siginfo actions", "[diag][exfilter][posix]") {
    SegvActionGuard guard;
    auto installer = CreateNativeExceptionFilterInstaller();
    auto filter = reinterpret_cast<uintptr_t>(&SegvHandler);

    SECTION("Ignored signal") {
        struct sigaction ignore{};
        sigemptyset(&ignore.sa_mask);
        ignore.sa_handler = SIG_IGN;
        REQUIRE(sigaction(SIGSEGV, &ignore, nullptr) == 0);

        auto previous = installer->Install(filter);
        REQUIRE(previous == reinterpret_cast<uintptr_t>(SIG_IGN));
        REQUIRE(installer->Reinstate(*previous));

        auto current = CurrentSegvAction();
        REQUIRE((current.sa_flags & SA_SIGINFO) == 0);
        REQUIRE(current.sa_handler == SIG_IGN);
    }

    SECTION("Default action") {
        struct sigaction fallback{};
        sigemptyset(&fallback.sa_mask);
        fallback.sa_handler = SIG_DFL;
        REQUIRE(sigaction(SIGSEGV, &fallback, nullptr) == 0);

        auto previous = installer->Install(filter);
        REQUIRE(previous == reinterpret_cast<uintptr_t>(SIG_DFL));
        REQUIRE(installer->Reinstate(*previous));

        auto current = CurrentSegvAction();
        REQUIRE((current.sa_flags & SA_SIGINFO) == 0);
        REQUIRE(current.sa_handler == SIG_DFL);
    }

    SECTION("Plain handler keeps its flags") {
        struct sigaction plain{};
        sigemptyset(&plain.sa_mask);
        plain.sa_handler = &PlainSegvHandler;
        plain.sa_flags = SA_NODEFER;
        REQUIRE(sigaction(SIGSEGV, &plain, nullptr) == 0);

        auto previous = installer->Install(filter);
        REQUIRE(previous == reinterpret_cast<uintptr_t>(&PlainSegvHandler));
        REQUIRE(installer->Reinstate(*previous));

        auto current = CurrentSegvAction();
        REQUIRE((current.sa_flags & SA_SIGINFO) == 0);
        REQUIRE((current.sa_flags & SA_NODEFER) != 0);
        REQUIRE(current.sa_handler == &PlainSegvHandler);
    }
}
#endif
