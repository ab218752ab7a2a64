// ==============================================================================
// jsondiff/app.hpp - Выполнение команд приложения
// ==============================================================================
//
// Связывает cli, profile, diff и output. main() только разбирает argv,
// создаёт Writer и вызывает run_diff().
//
// ==============================================================================

#ifndef JSONDIFF_APP_HPP
#define JSONDIFF_APP_HPP

#include <jsondiff/cli.hpp>
#include <jsondiff/output.hpp>

namespace jsondiff::app {

/// Выполнить сравнение двух файлов.
/// @return exit code: 0 - успех (включая найденные различия), 1 - ошибка
int run_diff(const cli::DiffCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer);

/// Полный цикл: parse argv -> Writer -> dispatch
int run(int argc, char** argv);

}  // namespace jsondiff::app

#endif  // JSONDIFF_APP_HPP
