//! # Scope Filter
//!
//! A forward, line-at-a-time state machine that decides which lines sit at
//! module level. Only those lines are offered to the storage variable
//! matcher, so a local `amount: uint256 = 0` inside a function body is not
//! reported as contract state.
//!
//! ## States and Triggers
//!
//! | From              | Trigger          | To                |
//! |-------------------|------------------|-------------------|
//! | any               | blank line       | OutsideFunction   |
//! | InsideDeclaration | dedent to header | OutsideFunction   |
//! | not a declaration | `@...` or `def`  | InsideFunction    |
//! | OutsideFunction   | `struct`, `event`, `enum`, `flag`, `interface` | InsideDeclaration |
//!
//! ## Known Imprecision
//!
//! A function body ends only at a blank line. Declarations that follow a
//! blank line inside a function body are read as module level:
//!
//! ```text
//! @external
//! def f():
//!     x: uint256 = 1
//!
//!     y: uint256 = 2      <- reported as a storage variable
//! ```

#ifndef VYDOC_EXTRACT_SCOPE_FILTER_HPP
#define VYDOC_EXTRACT_SCOPE_FILTER_HPP

#include "extract/extractors.hpp"
#include "model/contract.hpp"
#include "source/source.hpp"
#include "types/resolver.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace vydoc::extract {

enum class ScopeState {
    OutsideFunction,
    InsideFunction,
    InsideDeclaration, ///< Body of a struct, event, enum or interface.
};

/// What caused the most recent transition.
enum class ScopeTrigger {
    None,
    FunctionStart,
    DeclarationStart,
    BlankLine,
    Dedent,
};

[[nodiscard]] auto scope_state_to_string(ScopeState state) -> std::string_view;

class ScopeFilter {
public:
    /// Advances over one line. Returns true when the line is module level.
    auto feed(const source::Line& line) -> bool;

    [[nodiscard]] auto state() const -> ScopeState {
        return state_;
    }

    [[nodiscard]] auto last_trigger() const -> ScopeTrigger {
        return last_trigger_;
    }

    void reset();

private:
    ScopeState state_ = ScopeState::OutsideFunction;
    ScopeTrigger last_trigger_ = ScopeTrigger::None;
    uint32_t declaration_indent_ = 0;

    void transition(ScopeState to, ScopeTrigger trigger);
};

/// Lines of `source` the filter keeps, in order.
[[nodiscard]] auto module_level_lines(const source::Source& source)
    -> std::vector<const source::Line*>;

/// Storage variables: `name: T` or `name: public(T)`, optionally `= value`.
///
/// A declaration whose brackets stay open continues on the following lines.
/// `immutable(T)` and `transient(T)` resolve to `T`. Constants and the
/// `implements`/`uses`/`initializes`/`exports` directives are not variables.
[[nodiscard]] auto extract_variables(const source::Source& source,
                                     const types::TypeResolver& resolver)
    -> Extracted<model::Variable>;

} // namespace vydoc::extract

#endif // VYDOC_EXTRACT_SCOPE_FILTER_HPP
