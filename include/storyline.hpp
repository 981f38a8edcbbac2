#pragma once

#include "storyline/alignment.hpp"
#include "storyline/captions.hpp"
#include "storyline/config.hpp"
#include "storyline/date_resolver.hpp"
#include "storyline/location_resolver.hpp"
#include "storyline/log.hpp"
#include "storyline/named_entity.hpp"
#include "storyline/organization_resolver.hpp"
#include "storyline/pipeline.hpp"
#include "storyline/reference_data.hpp"
#include "storyline/result.hpp"
#include "storyline/spacy_merger.hpp"
#include "storyline/stanford_polisher.hpp"
#include "storyline/text.hpp"
#include "storyline/timed_text.hpp"
