#ifndef MERGERES_COMMON_H
#define MERGERES_COMMON_H

#if defined _WIN32 || defined __CYGWIN__
  #ifdef LIBMERGERES_EXPORTS
	#ifdef __GNUC__
	  #define MERGERES_PUBLIC __attribute__ ((dllexport))
	#else
	  #define MERGERES_PUBLIC __declspec(dllexport)
	#endif
  #else
	#ifdef __GNUC__
	  #define MERGERES_PUBLIC __attribute__ ((dllimport))
	#else
	  #define MERGERES_PUBLIC __declspec(dllimport)
	#endif
  #endif
  #define MERGERES_LOCAL
#else
  #if __GNUC__ >= 4
	#define MERGERES_PUBLIC __attribute__ ((visibility ("default")))
	#define MERGERES_LOCAL  __attribute__ ((visibility ("hidden")))
  #else
	#define MERGERES_PUBLIC
	#define MERGERES_LOCAL
  #endif
#endif

#include <boost/shared_ptr.hpp>
#include <stdint.h>
#include <string>
#include <vector>
#include <stdexcept>

#include <glog/logging.h>
#define VLOG_MACRO(lev) if(VLOG_IS_ON(lev)) VLOG(lev)

#define KEY_SEPARATOR "!"

namespace mergeres {
	//File contents and other opaque byte strings
	typedef std::string blob_t;
}; //namespace mergeres

#endif // MERGERES_COMMON_H
