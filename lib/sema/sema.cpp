// ouro/sema/sema.cpp - Semantic pipeline entry point
#include "ouro/sema/sema.hpp"

#include <iterator>

#include "ouro/sema/analysis/semantic_analyzer.hpp"
#include "ouro/sema/types/type_checker.hpp"

namespace ouro
{

std::vector<SymbolError> check(Program & program, SemanticModel & model)
{
  model.reset();

  SemanticAnalyzer analyzer(model.symbols(), model.types());
  std::vector<SymbolError> errors = analyzer.analyze(program);

  TypeChecker checker(model.symbols(), model.types());
  std::vector<SymbolError> type_errors = checker.check(program);

  errors.insert(
    errors.end(), std::make_move_iterator(type_errors.begin()),
    std::make_move_iterator(type_errors.end()));
  return errors;
}

}  // namespace ouro
