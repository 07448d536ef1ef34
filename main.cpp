#include "planeGrid/CornerFrame.hpp"
#include "planeGrid/Errors.hpp"
#include "planeGrid/Logger.hpp"
#include "planeGrid/PlaneMapper.hpp"

#include <iostream>

using namespace planeGrid;

// Worked example: a 3x3 grid whose top-left, top-right and bottom-left
// corners were sampled at (1,0,0), (1,1,0) and (1,0,1).
static void worked_example()
{
  CornerFrame frame(Point3 { 1.0, 0.0, 0.0 }, Point3 { 1.0, 1.0, 0.0 }, Point3 { 1.0, 0.0, 1.0 });
  PlaneMapper mapper(frame);

  Point3 center = mapper.mapGridCell(3, 1.5, 1.5);
  PLANEGRID_INFO("Frame " << frame.toString());
  PLANEGRID_INFO("Center of a size 3 grid: " << center.toString());

  for (int row = 0; row < 3; ++row)
  {
    for (int col = 0; col < 3; ++col)
    {
      std::cout << "cell (" << row << ", " << col << "): " << mapper.cellCenter(3, row, col).toString() << std::endl;
    }
  }
}

static void degenerate_example()
{
  try
  {
    CornerFrame frame(Point3 { 0.0, 0.0, 0.0 }, Point3 { 2.0, 0.0, 0.0 }, Point3 { 4.0, 0.0, 0.0 });
    PLANEGRID_WARNING("Collinear corners were accepted: " << frame.toString());
  }
  catch (const DegenerateFrameError& e)
  {
    PLANEGRID_INFO("Rejected collinear corners: " << e.what());
  }
}

int main()
{
  worked_example();
  degenerate_example();
  return 0;
}
