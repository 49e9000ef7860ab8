#include "errors.h"
#include <sstream>

using namespace mergeres;

extern MERGERES_PUBLIC const die_t mergeres::die=die_t();
extern MERGERES_PUBLIC const result_code_t mergeres::sok=result_code_t();

mergeres_exception::mergeres_exception(const result_code_t &code) : code_(code)
{
	std::stringstream s;
	s<<("Error code: ")<<code.code()<<", description: "<<code.desc();
	what_=s.str();
};
