#define BOOST_TEST_MODULE "MergeRes Tests"
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include <glog/logging.h>

int BOOST_TEST_CALL_DECL
main( int argc, char* argv[] )
{
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
#ifdef DEBUG
	google::LogToStderr();
#endif

	int res=::boost::unit_test::unit_test_main( &init_unit_test, argc, argv );
	google::ShutdownGoogleLogging();
	return res;
}
