#pragma once
#include <stdexcept>
#include <string>
#include <vector>

struct ExpressionError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Evaluates a numeric expression over a fixed grammar:
//
//   expr    := term (('+' | '-') term)*
//   term    := unary (('*' | '/' | '%') unary)*
//   unary   := ('+' | '-') unary | power
//   power   := primary (('^' | '**') unary)?
//   primary := number | name | name '(' expr (',' expr)* ')' | '(' expr ')'
//   number  := digits ['.' digits] [('e' | 'E') ['+' | '-'] digits]
//
// Names resolve only against the whitelisted constants and functions below;
// anything else is rejected with ExpressionError, as is nesting deeper than
// 256 levels.
double evaluate_expression(const std::string& text);

const std::vector<std::string>& expression_functions();
const std::vector<std::string>& expression_constants();
