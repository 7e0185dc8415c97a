/**
 * @file
 * @brief Umbrella header: front end, schema, extraction, validation and the Gate.
 */
#pragma once

#include "exprguard/exceptions/exprguard_exception.h"
#include "exprguard/exceptions/schema_error.h"
#include "exprguard/exceptions/syntax_error.h"
#include "exprguard/exceptions/unsupported_construct.h"
#include "exprguard/exceptions/validation_input_error.h"
#include "exprguard/Gate.h"
#include "extract/Extraction.h"
#include "extract/Extractor.h"
#include "schema/Config.h"
#include "schema/RuleSchema.h"
#include "validate/ValidationReport.h"
#include "validate/Validator.h"
