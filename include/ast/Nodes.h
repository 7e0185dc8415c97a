/***
 * Name: AST nodes umbrella
 * Purpose: Aggregate every concrete node header.
 */
#pragma once

#include "ast/Node.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"
#include "ast/Module.h"
#include "ast/AssignStmt.h"
#include "ast/AugAssignStmt.h"
#include "ast/ExprStmt.h"
#include "ast/IfStmt.h"
#include "ast/WhileStmt.h"
#include "ast/ForStmt.h"
#include "ast/ReturnStmt.h"
#include "ast/PassStmt.h"
#include "ast/IntLiteral.h"
#include "ast/FloatLiteral.h"
#include "ast/StringLiteral.h"
#include "ast/BoolLiteral.h"
#include "ast/NoneLiteral.h"
#include "ast/FStringLiteral.h"
#include "ast/Name.h"
#include "ast/Call.h"
#include "ast/Binary.h"
#include "ast/Compare.h"
#include "ast/Unary.h"
#include "ast/Attribute.h"
#include "ast/Subscript.h"
#include "ast/LambdaExpr.h"
#include "ast/IfExpr.h"
#include "ast/NamedExpr.h"
#include "ast/ListLiteral.h"
#include "ast/TupleLiteral.h"
#include "ast/DictLiteral.h"
#include "ast/SetLiteral.h"
