#include "broker_transport.hpp"

std::string to_string(shutdown_initiator initiator) {
	switch (initiator) {
	case shutdown_initiator::application:
		return "application";
	case shutdown_initiator::peer:
		return "peer";
	case shutdown_initiator::library:
		return "library";
	}
	return "unknown";
}
