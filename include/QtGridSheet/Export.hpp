/** \file Export.hpp
 *  Symbol visibility macro for the QtGridSheet library.
 */
#pragma once
#include <QtCore/qglobal.h>

#if defined(QTGRIDSHEET_STATIC)
#  define QTGRIDSHEET_EXPORT
#elif defined(QTGRIDSHEET_BUILD)
#  define QTGRIDSHEET_EXPORT Q_DECL_EXPORT
#else
#  define QTGRIDSHEET_EXPORT Q_DECL_IMPORT
#endif
