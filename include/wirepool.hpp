#pragma once

/*
===============================================================================
Wirepool — Public API Entry Point
===============================================================================

Everything under wirepool::core is public. Transports are supplied by the
application through transport::FactoryConcept.
===============================================================================
*/

#include <wirepool/core.hpp>
