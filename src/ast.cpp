#include "kalkon/ast.h"

namespace kalkon {

std::string operatorSymbol(UnaryOp op) {
    switch (op) {
        case UnaryOp::Negate:
            return "-";
        case UnaryOp::Identity:
            return "+";
        case UnaryOp::Invert:
            return "~";
    }
    return "?";
}

std::string operatorSymbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Subtract:
            return "-";
        case BinaryOp::Multiply:
            return "*";
        case BinaryOp::Divide:
            return "/";
        case BinaryOp::Modulo:
            return "%";
        case BinaryOp::Power:
            return "^";
        case BinaryOp::BitAnd:
            return "&";
        case BinaryOp::BitOr:
            return "|";
        case BinaryOp::ShiftLeft:
            return "<<";
        case BinaryOp::ShiftRight:
            return ">>";
    }
    return "?";
}

}  // namespace kalkon
