#pragma once

#include "crowdfund/crowdfund.hpp"
