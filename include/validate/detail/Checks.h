/**
 * @file
 * @brief One function per violation category; each appends to ctx.out.
 */
#pragma once

#include "validate/detail/CheckContext.h"

namespace exprguard::validate::detail {

void checkOperatorMembership(CheckContext& ctx);
void checkDatafieldMembership(CheckContext& ctx);
void checkArity(CheckContext& ctx);
void checkUnknownKwarg(CheckContext& ctx);
void checkKwargType(CheckContext& ctx);
void checkKwargRange(CheckContext& ctx);
void checkKwargAllowed(CheckContext& ctx);
void checkVectorScope(CheckContext& ctx);

} // namespace exprguard::validate::detail
