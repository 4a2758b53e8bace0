#pragma once
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tlsscan {

enum class OptionKind {
    Flag,      // --quiet
    Text,      // --cert FILE
    Integer    // --timeout N
};

/**
 * One recognized command-line option.
 */
struct OptionDefinition {
    std::string name;                          // "--xml_out"
    std::string dest;                          // "xml_file"
    OptionKind kind{OptionKind::Flag};
    std::string help;
    std::string metavar;                       // "FILE", shown in --help
    std::optional<std::string> default_value;  // Textual, converted per kind
};

/**
 * A titled block of options, as shown in --help.
 */
struct OptionGroup {
    std::string title;
    std::string description;
    std::vector<OptionDefinition> options;
};

/**
 * Contract every scan plugin fulfils to contribute its own flags.
 * The schema builder consumes these opaquely, in the order given.
 */
class PluginOptionProvider {
public:
    virtual ~PluginOptionProvider() = default;

    virtual std::string title() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<OptionDefinition> option_definitions() const = 0;
};

using PluginOptionProviders = std::vector<std::shared_ptr<const PluginOptionProvider>>;

/**
 * Values collected from the command line, keyed by option dest.
 * Flags not given are absent (read as false); text options not given and
 * without a default are absent.
 */
class OptionValues {
public:
    using Value = std::variant<bool, int, std::string>;

    bool flag(const std::string& dest) const;
    std::optional<std::string> text(const std::string& dest) const;
    std::optional<int> integer(const std::string& dest) const;
    bool has(const std::string& dest) const;

    void set_flag(const std::string& dest, bool value);
    void set_text(const std::string& dest, std::string value);
    void set_integer(const std::string& dest, int value);

    const std::unordered_map<std::string, Value>& raw() const { return values_; }

private:
    std::unordered_map<std::string, Value> values_;
};

/**
 * argv split into option values and positional server strings.
 */
struct CommandLine {
    OptionValues options;
    std::vector<std::string> targets;
    bool help_requested{false};
    bool version_requested{false};
};

/**
 * Full set of recognized flags. Registration order is kept for --help;
 * lookup is by name and a later registration of the same name replaces
 * the earlier one.
 */
class OptionSchema {
public:
    void add_group(OptionGroup group);
    void add_option(OptionDefinition option);

    const std::vector<OptionGroup>& groups() const { return groups_; }
    const std::vector<OptionDefinition>& ungrouped() const { return ungrouped_; }

    bool has_option(const std::string& name) const;
    const OptionDefinition* find(const std::string& name) const;

    /** Values for every option that has a default. */
    OptionValues defaults() const;

    /**
     * Parse argv (without the program name).
     * @throws ConfigurationError (UnknownOption, MissingOptionValue,
     *         InvalidOptionValue)
     */
    CommandLine parse(const std::vector<std::string>& args) const;

    void print_help(std::ostream& out, const std::string& program) const;

private:
    void index(const OptionDefinition& option);

    std::vector<OptionGroup> groups_;
    std::vector<OptionDefinition> ungrouped_;
    std::map<std::string, OptionDefinition> by_name_;
};

/**
 * The fourteen flags enabled by --regular, in canonical order.
 */
const std::vector<std::string>& regular_scan_flags();

/** Default for --timeout, in seconds. */
constexpr int kDefaultTimeoutSeconds = 5;

/** Default for --nb_retries. */
constexpr int kDefaultRetryCount = 3;

/**
 * Build the schema: client certificate, input/output and connectivity
 * groups, one group per plugin (in order), then --regular.
 */
OptionSchema build_option_schema(const PluginOptionProviders& plugins);

} // namespace tlsscan
