/***
 * Name: exprguard::extract::to_string(OperatorForm)
 * Purpose: Stable lowercase names for operator forms.
 */
#include "extract/Extraction.h"

namespace exprguard::extract {

const char* to_string(const OperatorForm form) {
  switch (form) {
    case OperatorForm::Call: return "call";
    case OperatorForm::Binary: return "binary";
    case OperatorForm::Compare: return "compare";
    case OperatorForm::Boolean: return "boolean";
    case OperatorForm::Unary: return "unary";
    case OperatorForm::Augmented: return "augmented";
  }
  return "binary";
}

} // namespace exprguard::extract
