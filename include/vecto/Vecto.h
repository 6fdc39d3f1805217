#ifndef VECTO_VECTO_H_INCLUDED_
#define VECTO_VECTO_H_INCLUDED_

#include "Kinda.h"
#include "Vector2.h"

#ifdef VECTO_WITH_EIGEN
#include "EigenInterop.h"
#endif

#endif
