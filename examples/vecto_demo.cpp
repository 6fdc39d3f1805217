#include "vecto/Vecto.h"

#include <cmath>
#include <cstring>
#include <vector>

using namespace Vecto;
using namespace Vecto::Geometry;

static const float TAU = 6.2831853f;

int main(int argc, char* argv[])
{
	for (int i = 1; i < argc; i++)
	{
		if (std::strcmp(argv[i], "-v") == 0)
			Messages::OptStream::set_level(Messages::Debug);
		else if (std::strcmp(argv[i], "-q") == 0)
			Messages::OptStream::set_level(Messages::Warning);
		else
			Messages::out(Messages::Warning) << "Ignoring unknown argument " << argv[i] << "\n";
	}

	Vec2 v(5.0f, 7.0f);
	v *= 2.0f;
	Messages::out(Messages::Info) << "(5, 7) * 2 = " << v << "\n";

	Messages::out(Messages::Info) << "angle of DOWN = " << Vec2::DOWN.angle() << "\n";
	Messages::out(Messages::Info) << "length of splat(10) = " << Vec2::splat(10.0f).length() << "\n";
	Messages::out(Messages::Info) << "splat(10) limited to 5 = " << Vec2::splat(10.0f).limit_length(5.0f) << "\n";
	Messages::out(Messages::Info) << "ZERO normalized = " << Vec2::ZERO.normalized() << "\n";

	Vec2 r(1.2f, 3.4f);
	for (int third = 1; third <= 3; third++)
	{
		Messages::out(Messages::Progress) << "(1.2, 3.4) rotated by " << third << "/3 turn = "
		                                  << r.rotated(TAU * third / 3.0f) << "\n";
	}

	Vector2i grid = static_cast<Vector2i>(Vec2(3.7f, -1.2f).floor());
	Messages::out(Messages::Info) << "floor(3.7, -1.2) as int = " << grid << ", % 2 = " << grid % 2 << "\n";

	std::vector<float> samples = {1.0f, 2.0f, 3.0f};
	try
	{
		Vec2 bad = Vec2::from_slice(samples);
		Messages::out(Messages::Info) << "unexpectedly built " << bad << "\n";
	}
	catch (const InvalidLength& e)
	{
		Messages::out(Messages::Warning) << "from_slice of " << samples.size() << " values: " << e.what() << "\n";
	}

	samples.pop_back();
	Messages::out(Messages::Info) << "from_slice of " << samples.size() << " values = " << Vec2::from_slice(samples) << "\n";

	return 0;
}
