// Standard signatures a host may install before adding its own functions.
#pragma once
#include "rainbow/signature.hpp"

namespace rainbow
{

    // Registers not, compare, calc, countFrom, sum and upperCase.
    // Throws config_error if the table is frozen or one of the names is taken.
    void install_prelude(SignatureTable &table);

} // namespace rainbow
