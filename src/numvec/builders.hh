#pragma once

#include <numvec/builders/fill.hh>
#include <numvec/builders/nested.hh>
#include <numvec/builders/random.hh>
#include <numvec/builders/sequence.hh>
