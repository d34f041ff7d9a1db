#pragma once

#include "vocabulary.hpp"
#include "batch.hpp"
#include "model.hpp"
#include "similarity.hpp"
#include "trainer.hpp"
