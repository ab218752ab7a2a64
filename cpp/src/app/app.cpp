// ==============================================================================
// app.cpp - Выполнение команд приложения
// ==============================================================================
//
// Порядок run_diff:
// 1. Профиль (если задан) + переопределения CLI -> RuleSet
// 2. Разбор обоих файлов и сравнение
// 3. Отчёт в stdout или в файл --output
//
// ==============================================================================

#include "jsondiff/app.hpp"

#include "jsondiff/diff.hpp"
#include "jsondiff/platform.hpp"
#include "jsondiff/profile.hpp"

#include <memory>
#include <string>
#include <type_traits>
#include <variant>

namespace jsondiff::app {

namespace {

profile::Overrides make_overrides(const cli::DiffCommand& cmd) {
    profile::Overrides overrides;
    overrides.ignore = cmd.ignore;
    overrides.unordered = cmd.unordered;
    if (cmd.show_nested) {
        overrides.show_nested_differences = true;
    }
    if (cmd.no_item_changes) {
        overrides.identify_array_item_changes = false;
    }
    return overrides;
}

std::string count_summary(const diff::DiffResult& result) {
    std::size_t changes = 0;
    std::size_t ignored = 0;
    for (const auto& entry : result.entries) {
        if (entry.type == diff::DiffType::Ignored) {
            ++ignored;
        } else {
            ++changes;
        }
    }
    if (changes == 0) {
        return "Documents are structurally equal (" + std::to_string(ignored) + " ignored)";
    }
    return "Found " + std::to_string(changes) + " difference(s) (" + std::to_string(ignored) +
           " ignored)";
}

}  // anonymous namespace

int run_diff(const cli::DiffCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer) {
    (void)global;

    // 1. Правила
    profile::Profile prof;
    if (cmd.profile.has_value()) {
        writer.debug("Loading profile: " + platform::path_to_utf8(*cmd.profile));
        auto loaded = profile::load(*cmd.profile);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        prof = std::move(loaded.profile);
        for (const auto& warning : prof.warnings) {
            writer.warn(warning);
        }
    }

    auto rules = profile::to_rule_set(prof, make_overrides(cmd));
    if (!rules) {
        writer.error(rules.error.format());
        return 1;
    }
    writer.debug("Rules: " + std::to_string(rules.rules.ignore().size()) + " ignore, " +
                 std::to_string(rules.rules.unordered().size()) + " unordered, show_nested=" +
                 (rules.rules.show_nested_differences() ? "true" : "false") +
                 ", identify_array_item_changes=" +
                 (rules.rules.identify_array_item_changes() ? "true" : "false"));
    for (const auto& pattern : rules.rules.ignore()) {
        writer.trace("ignore: " + pattern.text());
    }
    for (const auto& pattern : rules.rules.unordered()) {
        writer.trace("unordered: " + pattern.text());
    }

    // 2. Сравнение
    writer.info("Comparing " + platform::path_to_utf8(cmd.left) + " with " +
                platform::path_to_utf8(cmd.right));
    auto compared = diff::compare_files(cmd.left, cmd.right, rules.rules);
    if (!compared) {
        writer.error(compared.error.format());
        return 1;
    }

    // 3. Отчёт
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("failed to open output file '" + platform::path_to_utf8(*cmd.output) +
                         "'");
            return 1;
        }
        out = file_writer.get();
    }

    output::Style style = cmd.symbols ? output::Style::Symbols : output::Style::Readable;
    out->write_result(compared.result, style);

    writer.info(count_summary(compared.result));
    if (cmd.output.has_value()) {
        writer.info("Diff written to " + platform::path_to_utf8(*cmd.output));
    }
    return 0;
}

int run(int argc, char** argv) {
    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки разбора argv: сообщение как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    writer.trace("Platform: " + platform::os_name());

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_diff(cmd, parse_result.global, writer);
            }
        },
        parse_result.command);
}

}  // namespace jsondiff::app
