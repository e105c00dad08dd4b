#include <Arduino.h>
#include <stdio.h>
#include "Board_Hardware.h"
#include "Board_Pins.h"
#include "Node_Logic.h"
#include "Logger.h"

typedef Node_Logic<Board_LedPin, Board_Pin, Board_Clock, UART_Transport, Board_Random> Board_NodeLogic;

// Instance Management (Global scope to persist)
static Board_Hardware* hal = nullptr;
static Board_NodeLogic* logic = nullptr;

static void serial_sink(const char* line) {
    Serial.println(line);
}

// Offloaded LOCUS points go out as CSV: utc,fix,lat,lon,height
static void point_sink(const LoggedPoint& point) {
    char line[80];
    snprintf(line, sizeof(line), "%lu,%s,%.6f,%.6f,%d", (unsigned long)point.utc, LocusFixName(point.fix),
             (double)point.latitude, (double)point.longitude, (int)point.height);
    Serial.println(line);
}

void setup() {
    // 1. Debug log on the USB serial
    Serial.begin(NODE_LOG_BAUD);
    Logger::SetSink(serial_sink);
    Logger::SetLevel((LogLevel)NODE_LOG_LEVEL);

    // 2. Create HAL (owns every peripheral)
    hal = new Board_Hardware();
    hal->Init();

    // 3. Create Logic
    logic = new Board_NodeLogic(hal->status_led, hal->fault_led, hal->button,
                                hal->clock, hal->transport, hal->random);
    logic->SetPointSink(point_sink);
}

void loop() {
    // Never returns
    if (logic) logic->Run();
}
