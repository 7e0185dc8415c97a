/**
 * Name: exprguard::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace exprguard::lex {
    const char *to_string(const TokenKind k) {
        using enum exprguard::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Newline: return "Newline";
            case Semicolon: return "Semicolon";
            case If: return "If";
            case Else: return "Else";
            case Elif: return "Elif";
            case While: return "While";
            case For: return "For";
            case In: return "In";
            case Return: return "Return";
            case Pass: return "Pass";
            case Lambda: return "Lambda";
            case And: return "And";
            case Or: return "Or";
            case Not: return "Not";
            case Is: return "Is";
            case Reserved: return "Reserved";
            case Colon: return "Colon";
            case ColonEqual: return "ColonEqual";
            case Comma: return "Comma";
            case Dot: return "Dot";
            case Equal: return "Equal";
            case PlusEqual: return "PlusEqual";
            case Plus: return "Plus";
            case MinusEqual: return "MinusEqual";
            case Minus: return "Minus";
            case StarEqual: return "StarEqual";
            case Star: return "Star";
            case StarStarEqual: return "StarStarEqual";
            case StarStar: return "StarStar";
            case SlashEqual: return "SlashEqual";
            case Slash: return "Slash";
            case SlashSlashEqual: return "SlashSlashEqual";
            case SlashSlash: return "SlashSlash";
            case PercentEqual: return "PercentEqual";
            case Percent: return "Percent";
            case LShiftEqual: return "LShiftEqual";
            case LShift: return "LShift";
            case RShiftEqual: return "RShiftEqual";
            case RShift: return "RShift";
            case AmpEqual: return "AmpEqual";
            case Amp: return "Amp";
            case CaretEqual: return "CaretEqual";
            case Caret: return "Caret";
            case PipeEqual: return "PipeEqual";
            case Pipe: return "Pipe";
            case Tilde: return "Tilde";
            case EqEq: return "EqEq";
            case NotEq: return "NotEq";
            case Lt: return "Lt";
            case Le: return "Le";
            case Gt: return "Gt";
            case Ge: return "Ge";
            case LParen: return "LParen";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case RBracket: return "RBracket";
            case LBrace: return "LBrace";
            case RBrace: return "RBrace";
            case Ident: return "Ident";
            case Int: return "Int";
            case Float: return "Float";
            case String: return "String";
            case BoolLit: return "BoolLit";
            case NoneLit: return "NoneLit";
        }
        return "Unknown";
    }
} // namespace exprguard::lex
