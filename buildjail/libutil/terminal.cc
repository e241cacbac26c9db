#include "buildjail/libutil/terminal.hh"
#include "buildjail/libutil/environment-variables.hh"

namespace buildjail {

bool isOutputARealTerminal(StandardOutputStream fileno)
{
    return isatty(int(fileno)) && getEnv("TERM").value_or("dumb") != "dumb";
}

bool shouldANSI(StandardOutputStream fileno)
{
    // NO_COLOR CLICOLOR CLICOLOR_FORCE Colours?
    // set      x        x              No
    // unset    x        set            Yes
    // unset    x        unset          If attached to a terminal
    auto compute = [](StandardOutputStream fileno) -> bool {
        bool mustNotColour = getEnv("NO_COLOR").has_value() || getEnv("NOCOLOR").has_value();
        bool shouldForce = getEnv("CLICOLOR_FORCE").has_value() || getEnv("FORCE_COLOR").has_value();
        bool isTerminal = isOutputARealTerminal(fileno);
        return !mustNotColour && (shouldForce || isTerminal);
    };
    static bool cached[2] = {compute(StandardOutputStream::Stdout), compute(StandardOutputStream::Stderr)};
    return cached[int(fileno) - 1];
}

std::string filterANSIEscapes(std::string_view s, bool filterAll)
{
    std::string t;
    auto i = s.begin();

    while (i != s.end()) {

        if (*i == '\e') {
            std::string e;
            e += *i++;

            if (i != s.end() && *i == '[') { // CSI sequence
                e += *i++;
                // CSI is terminated by a byte in the range 0x40–0x7e.
                char last = 0;

                // eat parameter / intermediate bytes
                while (i != s.end() && *i >= 0x20 && *i <= 0x3f) e += *i++;
                // eat terminator byte
                if (i != s.end() && *i >= 0x40 && *i <= 0x7e) e += last = *i++;

                // print colors if enabled
                if (!filterAll && last == 'm')
                    t += e;
            } else if (i != s.end() && *i >= 0x40 && *i <= 0x5f) {
                // two-character escape, drop it
                i++;
            }
        }

        else if (*i == '\r' || *i == '\a')
            // do nothing for now
            i++;

        else {
            t += *i++;
        }
    }

    return t;
}

}
