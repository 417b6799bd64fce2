#pragma once

// Upper bound on records accepted by a single mint action
#define MAX_MINT_LIMIT 100

// Settlement batch size when endsale is called with limit 0, and its ceiling
#define DEFAULT_LIMIT 50
#define MAX_LIMIT 100

#define DEFAULT_MAX_PER_WALLET 1

// Rates are expressed in basis points
#define PERCENT_DENOM_BP 10000
