#pragma once
///@file

namespace buildjail {

/**
 * Exit the program with a given exit code.
 */
class Exit
{
public:
    int status;
    Exit() : status(0) { }
    explicit Exit(int status) : status(status) { }
};

}
