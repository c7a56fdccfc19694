#pragma once
/**
 * @page dw-command-dispatch dacwire Command Dispatcher
 * @file command_dispatch.hpp
 * @brief Centralized resolution of CLI words -> protocol Commands.
 *
 * @details
 * PURPOSE
 * -------
 * The dispatcher is the **glue layer** between the words a user types after the target
 * (`dacwire-cli /dev/ttyACM0 dac 3 4096`) and the range-checked builders in
 * dacwire/command.hpp. It exists so that:
 *   - `main.cpp` never has to know about individual builders.
 *   - Parsing, validation, and Command selection live in one place.
 *   - A bad value is rejected here with a stable reason, before anything is opened.
 *
 * VOCABULARY
 * ----------
 *   dac <ch> <value>               DAC(ch) = value           ch 0..7, value 0..65535
 *   attach <ch> <table>            bind DAC(ch) to table     table 0..3       (alias: bind)
 *   table <table> <index> <value>  table[index] = value      index 0..255
 *   offset <n>                     select table offset       n 0..255
 *   gpio <pin> <on|off|1|0>        set GPIO(pin)             pin 0..7
 *   keepalive                      keepalive                                  (alias: ka)
 *   ldac                           latch DAC registers
 *   register <reg> <value>         register write (0xFB)     reg 0..255       (alias: reg)
 *   rs422 <speed>                  two register writes: reg1 = speed>>16, reg2 = speed&0xFFFF
 *
 * Numbers accept decimal, 0x-hex and 0-octal (strtol base 0).
 *
 * ERRORS
 * ------
 * Stable strings so scripts can act on them:
 *   "empty_command", "unknown_command:<word>", "bad_arity:<word>(<n>)",
 *   "bad_value:channel(0..7)", "bad_value:value(0..65535)", "bad_value:state(on|off)", ...
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<dacwire::Command> cmds;
 *   std::string err;
 *   if (!dacwire::build_from_tokens({"gpio", "1", "on"}, cmds, err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *       return 2;
 *   }
 * @endcode
 *
 * MAINTENANCE
 * -----------
 * To add a word: extend Verb, extend name_to_verb() and verb_arity(), then add the case to
 * build_commands().
 */

#include <cstddef>
#include <string>
#include <vector>
#include "dacwire/command.hpp"

namespace dacwire {

/**
 * @enum Verb
 * @brief Every word the one-shot CLI understands.
 */
enum class Verb {
    DAC,
    ATTACH,
    TABLE,
    OFFSET,
    GPIO,
    KEEPALIVE,
    LDAC,
    REGISTER,
    RS422
};

/// Map a (case-insensitive) word to a Verb. Unknown words return false.
bool name_to_verb(const std::string& name, Verb& out);

/// Number of value arguments a verb takes.
std::size_t verb_arity(Verb v);

/// Canonical spelling of a verb ("dac", "attach", ...).
const char* verb_name(Verb v);

/**
 * @brief Build the Command(s) for a verb from its string arguments.
 *
 * Appends to @p out (rs422 appends two). On failure @p out is left as it was and
 * @p err names the first bad argument.
 */
bool build_commands(Verb verb, const std::vector<std::string>& values,
                    std::vector<Command>& out, std::string& err);

/// tokens[0] is the verb, the rest are its values.
bool build_from_tokens(const std::vector<std::string>& tokens,
                       std::vector<Command>& out, std::string& err);

} // namespace dacwire
