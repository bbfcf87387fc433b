#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sapio {

using Amount = int64_t; // sats

enum class Network { Bitcoin, Testnet, Signet, Regtest };

const char* to_string(Network n);
std::optional<Network> parse_network(std::string_view name);

struct CompileEnv {
    bool trace = false;         // SAPIO_TRACE: log branch resolution to stderr
    bool diagJson = false;      // SAPIO_DIAG_JSON: print failure diagnostics as JSON
    bool failFast = false;      // SAPIO_FAIL_FAST: stop at the first fatal branch
    bool skipSkippable = false; // SAPIO_SKIP_SKIPPABLE: never evaluate Skippable branches
    std::string network;        // SAPIO_NETWORK: empty = keep the context's network
};

class TemplateBuilder;

// Compilation-time environment. Borrowed read-only by guards, conditions and
// production functions; a compilation never mutates the context it was handed.
class Context {
public:
    Context(Network network, Amount funds);

    Network network() const { return network_; }
    Amount funds() const { return funds_; }
    uint32_t height() const { return height_; }
    int64_t time() const { return time_; }
    const std::vector<std::string>& path() const { return path_; }
    std::string path_string() const;

    Context& set_clock(uint32_t height, int64_t time);
    Context& set_network(Network n) { network_ = n; return *this; }

    // Child context one path segment deeper (one per contract, one per branch).
    Context derive(std::string_view name) const;
    Context with_funds(Amount funds) const;

    TemplateBuilder template_builder() const;

    const CompileEnv& env() const { return env_; }
    void set_env(CompileEnv e) { env_ = std::move(e); }

private:
    Network network_;
    Amount funds_;
    uint32_t height_ = 0;
    int64_t time_ = 0;
    std::vector<std::string> path_;
    CompileEnv env_{};
};

// Detect compilation flags from process env vars (SAPIO_*).
CompileEnv detect_env();

// Store `env` in the context and apply its overrides (network).
void apply_env(Context& ctx, const CompileEnv& env);

} // namespace sapio
