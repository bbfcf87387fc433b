// template.hpp - transaction templates produced by branch production functions
#pragma once
#include "sapio/context.hpp"
#include "sapio/edn.hpp"
#include <cstdint>
#include <string>
#include <vector>

#include <llvm/Support/Error.h>

namespace sapio {

struct Output {
    Amount amount = 0;
    edn::value_ptr destination; // clause form, address string, ...
    edn::value_ptr metadata;    // optional
};

struct Template {
    std::string label;
    std::vector<Output> outputs;
    uint32_t lock_time = 0;
    uint32_t sequence = 0xffffffff;
    edn::value_ptr metadata;

    Amount total_amount() const;
    edn::value_ptr to_edn() const;
};

// Accumulates outputs against the funds of the context it was started from.
class TemplateBuilder {
public:
    explicit TemplateBuilder(const Context& ctx);

    TemplateBuilder& add_output(Amount amount, edn::value_ptr destination, edn::value_ptr metadata = nullptr);
    TemplateBuilder& set_lock_time(uint32_t lock_time) { tmpl_.lock_time = lock_time; return *this; }
    TemplateBuilder& set_sequence(uint32_t sequence) { tmpl_.sequence = sequence; return *this; }
    TemplateBuilder& set_label(std::string label) { tmpl_.label = std::move(label); return *this; }
    TemplateBuilder& set_metadata(edn::value_ptr m) { tmpl_.metadata = std::move(m); return *this; }

    Amount spent() const { return tmpl_.total_amount(); }
    Amount remaining() const { return funds_ - spent(); }

    // Fails with OutOfFunds if an output is negative or the outputs exceed the funds.
    llvm::Expected<Template> build() const;

private:
    Amount funds_;
    std::string path_;
    Template tmpl_;
};

} // namespace sapio
