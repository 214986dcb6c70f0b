#pragma once

// Umbrella header for the indicator set.

#include "sta/ta/Averages.hpp"
#include "sta/ta/Channels.hpp"
#include "sta/ta/Dispersion.hpp"
#include "sta/ta/Errors.hpp"
#include "sta/ta/Extremum.hpp"
#include "sta/ta/Momentum.hpp"
#include "sta/ta/Names.hpp"
#include "sta/ta/Outputs.hpp"
#include "sta/ta/Range.hpp"
#include "sta/ta/Sample.hpp"
#include "sta/ta/Stochastic.hpp"
#include "sta/ta/Volume.hpp"
