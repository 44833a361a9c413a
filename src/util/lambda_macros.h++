#pragma once

// Short lambdas for one-expression transforms, e.g.
// `opt.transform(λx(std::string(x)))`. They capture nothing.

#define λARG        [[maybe_unused]] auto &&
#define λBODY(EXPR) noexcept(noexcept(EXPR)) -> decltype(EXPR) { return (EXPR); }

#define λx(EXPR)    []( λARG x )          λBODY(EXPR)
#define λxy(EXPR)   []( λARG x, λARG y )  λBODY(EXPR)
